#pragma once
#include <cstdint>
#include <optional>

#include "../../core/config.h"

// Behaviour and sizing of one boid simulation. Loading these from disk is the caller's concern.
struct SimulationSettings {
    int agentCountHint{ config::DEFAULT_AGENT_COUNT };  // Rounded up to a whole number of work groups
    int treeDepth{ config::DEFAULT_TREE_DEPTH };
    float speed{ config::DEFAULT_SPEED };
    float cohesionRadius{ config::DEFAULT_COHESION_RADIUS };
    float alignWeight{ config::DEFAULT_ALIGN_WEIGHT };
    float steerWeight{ config::DEFAULT_STEER_WEIGHT };
    float spawnHalfExtent{ config::DEFAULT_SPAWN_HALF_EXTENT };
    std::optional<uint32_t> seed;                       // Random device when empty
};

// Throws std::invalid_argument describing the first offending field
void validateSettings(const SimulationSettings& settings);

// Boid count actually simulated: the hint rounded up to a multiple of the work group width
uint32_t resolveAgentCount(int agentCountHint);

// Accumulator slots reduced each pass: the next power of two at or above agentCount
uint32_t resolveSlotCount(uint32_t agentCount);
