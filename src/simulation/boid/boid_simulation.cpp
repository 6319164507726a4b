#include "boid_simulation.h"
#include "../../core/config.h"
#include "../../utils/timer.h"
#include <iostream>
#include <utility>

const SimulationSettings& BoidSimulation::validated(const SimulationSettings& settings)
{
    validateSettings(settings);
    return settings;
}

BoidSimulation::BoidSimulation(ComputeDevice& device, const SimulationSettings& settings)
    : m_device(device),
      m_settings(validated(settings)),
      m_agentCount(resolveAgentCount(m_settings.agentCountHint)),
      m_agents(device, m_agentCount),
      m_accumulators(device, m_agentCount),
      m_treeBuilder(device, static_cast<uint32_t>(m_settings.treeDepth)),
      m_motion(device, uint32_t(1) << m_settings.treeDepth),
      m_tree(static_cast<uint32_t>(m_settings.treeDepth))
{
    m_agents.reset(m_settings.spawnHalfExtent, m_settings.seed);

    std::cout << "BoidSimulation: Initialized " << m_agentCount << " boids ("
              << m_accumulators.getSlotCount() << " accumulator slots) with tree depth "
              << m_settings.treeDepth << " on " << m_device.getName() << "\n";
    if (m_agentCount != static_cast<uint32_t>(m_settings.agentCountHint)) {
        std::cout << "BoidSimulation: Agent count " << m_settings.agentCountHint
                  << " rounded up to a multiple of " << config::LOCAL_GROUP_WIDTH << "\n";
    }
}

void BoidSimulation::step()
{
    TimerCPU timer("Boid Step");

    try {
        // Published only once the whole step has gone through
        PartitionTree tree = m_treeBuilder.build(m_agents, m_accumulators);
        std::vector<Group> leafGroups = tree.getLeafGroups();
        m_motion.integrate(m_agents, leafGroups, MotionBehavior::fromSettings(m_settings));

        m_tree = std::move(tree);
        m_leafGroups = std::move(leafGroups);
    }
    catch (const std::exception& e) {
        std::cerr << "BoidSimulation: Step " << m_stepCount << " aborted: " << e.what() << "\n";
        throw;
    }

    m_stepCount++;

    if (config::logStepTiming) {
        std::cout << m_agentCount << " boid sim took " << timer.elapsedMs() << " ms\n";
    }
}

void BoidSimulation::reset(std::optional<uint32_t> seed)
{
    m_agents.reset(m_settings.spawnHalfExtent, seed ? seed : m_settings.seed);
    m_tree = PartitionTree(static_cast<uint32_t>(m_settings.treeDepth));
    m_leafGroups.clear();
}

void BoidSimulation::setBoids(const std::vector<Boid>& boids)
{
    m_agents.setBoids(boids);
    m_tree = PartitionTree(static_cast<uint32_t>(m_settings.treeDepth));
    m_leafGroups.clear();
}
