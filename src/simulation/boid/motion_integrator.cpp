#include "motion_integrator.h"
#include "agent_store.h"
#include "simulation_settings.h"
#include "../../core/config.h"
#include <stdexcept>
#include <string>

MotionBehavior MotionBehavior::fromSettings(const SimulationSettings& settings)
{
    MotionBehavior behavior;
    behavior.speed = settings.speed;
    behavior.cohesionRadius = settings.cohesionRadius;
    behavior.steerWeight = settings.steerWeight;
    behavior.alignWeight = settings.alignWeight;
    return behavior;
}

MotionIntegrator::MotionIntegrator(ComputeDevice& device, uint32_t maxGroupCount)
    : m_device(device), m_maxGroupCount(maxGroupCount)
{
    if (maxGroupCount == 0) {
        throw std::invalid_argument("MotionIntegrator needs room for at least one group");
    }

    m_motionKernel = m_device.loadKernel(config::MOTION_KERNEL);
    m_groupBuffer = m_device.allocateBuffer<Group>(maxGroupCount);
}

MotionIntegrator::~MotionIntegrator()
{
    m_device.releaseBuffer(m_groupBuffer);
}

void MotionIntegrator::integrate(AgentStore& agents, const std::vector<Group>& leafGroups, const MotionBehavior& behavior)
{
    if (leafGroups.size() > m_maxGroupCount) {
        throw std::length_error("MotionIntegrator: " + std::to_string(leafGroups.size()) +
            " groups exceed the group buffer capacity of " + std::to_string(m_maxGroupCount));
    }

    if (!leafGroups.empty()) {
        m_device.write(m_groupBuffer, leafGroups);
    }

    MotionParams params;
    params.groupCount = static_cast<uint32_t>(leafGroups.size());
    params.speed = behavior.speed;
    params.cohesionRadius = behavior.cohesionRadius;
    params.steerWeight = behavior.steerWeight;
    params.alignWeight = behavior.alignWeight;
    params.agentCount = agents.getAgentCount();

    agents.markDirty();
    m_device.dispatch(m_motionKernel,
        { m_groupBuffer, agents.getReadBuffer() },
        { agents.getWriteBuffer() },
        groupCountFor(params.agentCount, config::LOCAL_GROUP_WIDTH), params);
    m_device.barrier();

    // The freshly written boids become the current population
    agents.rotateBuffers();
}
