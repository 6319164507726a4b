#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "boid_structs.h"
#include "parallel_reducer.h"
#include "partition_selector.h"
#include "../../compute/compute_device.h"

class AgentStore;
class AccumulatorBuffer;

// Complete binary tree of groups, flattened level by level.
// The node of tag (level, mask) lives at index 2^level - 1 + mask, so the
// children of (level, mask) are (level + 1, mask) and (level + 1, mask | 1 << level).
// Absent nodes hold no boids.
struct PartitionTree {
    uint32_t depth{ 0 };
    std::vector<std::optional<Group>> nodes;

    PartitionTree() = default;
    explicit PartitionTree(uint32_t treeDepth);

    static size_t nodeIndex(uint32_t level, uint32_t mask) { return (size_t(1) << level) - 1 + mask; }
    static size_t nodeCountFor(uint32_t treeDepth) { return (size_t(2) << treeDepth) - 1; }

    size_t getLeafOffset() const { return (size_t(1) << depth) - 1; }
    size_t getLeafSlotCount() const { return size_t(1) << depth; }

    const std::optional<Group>& getNode(uint32_t level, uint32_t mask) const;

    // Present leaf groups, in node order
    std::vector<Group> getLeafGroups() const;
    // Planes of every present internal node, for debug geometry
    std::vector<SeparatingPlane> getSeparatingPlanes() const;
    // Number of boids held by the present leaves
    uint64_t getLeafPopulation() const;
};

/**
 * PartitionTreeBuilder - Builds the partition tree for the current boid positions
 *
 * Root: seed accumulators from every boid, reduce, derive the root group.
 * Level l: for each mask in [0, 2^l), split the node (l, mask) with the selector
 * and reduce again; absent nodes get two absent children without any dispatch.
 * Done after level depth - 1. Levels run strictly in order.
 */
class PartitionTreeBuilder {
public:
    enum class State { Root, Level, Done };

    PartitionTreeBuilder(ComputeDevice& device, uint32_t treeDepth);

    PartitionTree build(AgentStore& agents, AccumulatorBuffer& accumulators);

    State getState() const { return m_state; }
    uint32_t getCurrentLevel() const { return m_currentLevel; }
    uint32_t getTreeDepth() const { return m_treeDepth; }

    // Statistics of the last build
    size_t getSplitCount() const { return m_splitCount; }
    size_t getSkippedSplitCount() const { return m_skippedSplitCount; }

private:
    void traceSplit(uint32_t level, uint32_t mask, size_t planeIndex, bool present) const;

    ParallelReducer m_reducer;
    PartitionSelector m_selector;
    uint32_t m_treeDepth;

    State m_state = State::Done;
    uint32_t m_currentLevel = 0;
    size_t m_splitCount = 0;
    size_t m_skippedSplitCount = 0;
};
