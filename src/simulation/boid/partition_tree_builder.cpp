#include "partition_tree_builder.h"
#include "accumulator_buffer.h"
#include "agent_store.h"
#include "boid_kernels.h"
#include "../../core/config.h"
#include <algorithm>
#include <bitset>
#include <iostream>
#include <stdexcept>
#include <string>

PartitionTree::PartitionTree(uint32_t treeDepth)
    : depth(treeDepth), nodes(nodeCountFor(treeDepth))
{
}

const std::optional<Group>& PartitionTree::getNode(uint32_t level, uint32_t mask) const
{
    if (level > depth || mask >= (1u << level)) {
        throw std::out_of_range("PartitionTree: no node for level " + std::to_string(level) +
            ", mask " + std::to_string(mask));
    }
    return nodes[nodeIndex(level, mask)];
}

std::vector<Group> PartitionTree::getLeafGroups() const
{
    std::vector<Group> leaves;
    leaves.reserve(getLeafSlotCount());
    for (size_t i = getLeafOffset(); i < nodes.size(); ++i) {
        if (nodes[i]) leaves.push_back(*nodes[i]);
    }
    return leaves;
}

std::vector<SeparatingPlane> PartitionTree::getSeparatingPlanes() const
{
    std::vector<SeparatingPlane> planes;
    size_t internalCount = std::min(getLeafOffset(), nodes.size());
    for (size_t i = 0; i < internalCount; ++i) {
        if (nodes[i]) planes.push_back(BoidKernels::planeFromGroup(*nodes[i]));
    }
    return planes;
}

uint64_t PartitionTree::getLeafPopulation() const
{
    uint64_t population = 0;
    for (size_t i = getLeafOffset(); i < nodes.size(); ++i) {
        if (nodes[i]) population += nodes[i]->count;
    }
    return population;
}

PartitionTreeBuilder::PartitionTreeBuilder(ComputeDevice& device, uint32_t treeDepth)
    : m_reducer(device), m_selector(device), m_treeDepth(treeDepth)
{
    if (treeDepth == 0 || treeDepth > static_cast<uint32_t>(config::MAX_TREE_DEPTH)) {
        throw std::invalid_argument("PartitionTreeBuilder: tree depth must be in [1, " +
            std::to_string(config::MAX_TREE_DEPTH) + "], got " + std::to_string(treeDepth));
    }
}

PartitionTree PartitionTreeBuilder::build(AgentStore& agents, AccumulatorBuffer& accumulators)
{
    PartitionTree tree(m_treeDepth);
    m_splitCount = 0;
    m_skippedSplitCount = 0;

    // Root: every boid in one group
    m_state = State::Root;
    m_currentLevel = 0;
    accumulators.seedFromAgents(agents);
    Accumulator root = m_reducer.reduce(accumulators);
    tree.nodes[0] = BoidKernels::groupFromAccumulator(root.left);

    size_t total = 0;
    for (uint32_t level = 0; level < m_treeDepth; ++level) {
        m_state = State::Level;
        m_currentLevel = level;

        for (uint32_t mask = 0; mask < (1u << level); ++mask) {
            const size_t planeIndex = total++;
            const std::optional<Group> parent = tree.nodes[planeIndex];

            if (config::traceTreeTraversal) {
                traceSplit(level, mask, planeIndex, parent.has_value());
            }

            if (!parent) {
                // Nothing to split: both children stay absent
                m_skippedSplitCount++;
                continue;
            }

            m_selector.select(agents, accumulators, level, mask, *parent);
            Accumulator split = m_reducer.reduce(accumulators);

            tree.nodes[PartitionTree::nodeIndex(level + 1, mask | (1u << level))] =
                BoidKernels::groupFromAccumulator(split.left);
            tree.nodes[PartitionTree::nodeIndex(level + 1, mask)] =
                BoidKernels::groupFromAccumulator(split.right);
            m_splitCount++;
        }
    }

    m_state = State::Done;
    return tree;
}

void PartitionTreeBuilder::traceSplit(uint32_t level, uint32_t mask, size_t planeIndex, bool present) const
{
    std::string bits = std::bitset<32>(mask).to_string();
    size_t width = level == 0 ? 1 : level;
    std::cerr << "PartitionTreeBuilder: Level: " << level
              << ", Mask: " << bits.substr(bits.size() - width)
              << ", Plane idx: " << planeIndex
              << (present ? "" : " (absent)") << "\n";
}
