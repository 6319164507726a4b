#pragma once

#include <cstdint>

#include "boid_structs.h"
#include "../../compute/compute_device.h"

class AgentStore;
class AccumulatorBuffer;

/**
 * PartitionSelector - Splits one tree node by its separating plane
 *
 * A single pass over every boid: all accumulator slots are cleared, and boids
 * tagged exactly (level, mask) move to (level + 1, mask | side << level) and seed
 * the left (positive side) or right half of their slot. Boids on the plane go right.
 * The pass costs O(N) whatever the node's population.
 */
class PartitionSelector {
public:
    explicit PartitionSelector(ComputeDevice& device);

    void select(AgentStore& agents, AccumulatorBuffer& accumulators,
                uint32_t level, uint32_t mask, const SeparatingPlane& plane);

    // Splits by the plane through the parent's centroid, orthogonal to its mean heading
    void select(AgentStore& agents, AccumulatorBuffer& accumulators,
                uint32_t level, uint32_t mask, const Group& parent);

private:
    ComputeDevice& m_device;
    KernelHandle m_selectKernel{};
};
