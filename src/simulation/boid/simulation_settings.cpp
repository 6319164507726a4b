#include "simulation_settings.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

    void requireFinite(float value, const char* name)
    {
        if (!std::isfinite(value)) {
            throw std::invalid_argument(std::string("Simulation setting '") + name + "' must be finite");
        }
    }

} // namespace

void validateSettings(const SimulationSettings& settings)
{
    if (settings.agentCountHint <= 0) {
        throw std::invalid_argument("Agent count must be positive, got " + std::to_string(settings.agentCountHint));
    }
    // Keep the padded slot count representable
    if (settings.agentCountHint > (1 << 30)) {
        throw std::invalid_argument("Agent count exceeds the supported maximum of 2^30, got " +
            std::to_string(settings.agentCountHint));
    }
    if (settings.treeDepth <= 0) {
        throw std::invalid_argument("Tree depth must be positive, got " + std::to_string(settings.treeDepth));
    }
    if (settings.treeDepth > config::MAX_TREE_DEPTH) {
        throw std::invalid_argument("Tree depth cannot exceed " + std::to_string(config::MAX_TREE_DEPTH) +
            ", got " + std::to_string(settings.treeDepth));
    }

    requireFinite(settings.speed, "speed");
    requireFinite(settings.cohesionRadius, "cohesionRadius");
    requireFinite(settings.alignWeight, "alignWeight");
    requireFinite(settings.steerWeight, "steerWeight");
    requireFinite(settings.spawnHalfExtent, "spawnHalfExtent");

    if (settings.spawnHalfExtent <= 0.0f) {
        throw std::invalid_argument("Spawn half extent must be positive");
    }
}

uint32_t resolveAgentCount(int agentCountHint)
{
    if (agentCountHint <= 0) {
        throw std::invalid_argument("Agent count must be positive, got " + std::to_string(agentCountHint));
    }
    uint32_t width = config::LOCAL_GROUP_WIDTH;
    uint32_t hint = static_cast<uint32_t>(agentCountHint);
    return ((hint + width - 1) / width) * width;
}

uint32_t resolveSlotCount(uint32_t agentCount)
{
    uint32_t slots = 1;
    while (slots < agentCount) {
        slots <<= 1;
    }
    return slots;
}
