#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "accumulator_buffer.h"
#include "agent_store.h"
#include "boid_structs.h"
#include "motion_integrator.h"
#include "partition_tree_builder.h"
#include "simulation_settings.h"
#include "../../compute/compute_device.h"

/**
 * BoidSimulation - Flocking driven by an approximate partition tree
 *
 * Every step rebuilds a binary space partition of the boids from repeated
 * parallel reductions and steers each boid from the statistics of the leaf groups.
 *
 * The compute device is owned by the caller and must outlive the simulation.
 * Device buffers are acquired in the constructor and released in the destructor.
 * A ComputeDeviceError thrown mid-step leaves the device state undefined.
 */
class BoidSimulation {
public:
    BoidSimulation(ComputeDevice& device, const SimulationSettings& settings = SimulationSettings{});

    BoidSimulation(const BoidSimulation&) = delete;
    BoidSimulation& operator=(const BoidSimulation&) = delete;

    // Builds the partition tree, then moves every boid
    void step();

    // Re-randomizes the population. Without a seed the configured one is used.
    void reset(std::optional<uint32_t> seed = std::nullopt);
    void setBoids(const std::vector<Boid>& boids);

    // Presentation access: boids are synced from the device on the first read after a step
    const std::vector<Boid>& getBoids() { return m_agents.getBoids(); }
    const std::vector<Group>& getLeafGroups() const { return m_leafGroups; }
    std::vector<SeparatingPlane> getSeparatingPlanes() const { return m_tree.getSeparatingPlanes(); }
    const PartitionTree& getPartitionTree() const { return m_tree; }

    const SimulationSettings& getSettings() const { return m_settings; }
    uint32_t getAgentCount() const { return m_agentCount; }
    uint32_t getSlotCount() const { return m_accumulators.getSlotCount(); }
    size_t getStepCount() const { return m_stepCount; }
    bool isBoidSnapshotStale() const { return m_agents.isDirty(); }
    size_t getBoidSyncCount() const { return m_agents.getSyncCount(); }

    const PartitionTreeBuilder& getTreeBuilder() const { return m_treeBuilder; }

private:
    static const SimulationSettings& validated(const SimulationSettings& settings);

    ComputeDevice& m_device;
    SimulationSettings m_settings;
    uint32_t m_agentCount;

    AgentStore m_agents;
    AccumulatorBuffer m_accumulators;
    PartitionTreeBuilder m_treeBuilder;
    MotionIntegrator m_motion;

    PartitionTree m_tree;
    std::vector<Group> m_leafGroups;
    size_t m_stepCount = 0;
};
