#include "partition_selector.h"
#include "accumulator_buffer.h"
#include "agent_store.h"
#include "boid_kernels.h"
#include "../../core/config.h"
#include <stdexcept>

PartitionSelector::PartitionSelector(ComputeDevice& device)
    : m_device(device)
{
    m_selectKernel = m_device.loadKernel(config::SELECT_KERNEL);
}

void PartitionSelector::select(AgentStore& agents, AccumulatorBuffer& accumulators,
                               uint32_t level, uint32_t mask, const SeparatingPlane& plane)
{
    if (level >= static_cast<uint32_t>(config::MAX_TREE_DEPTH)) {
        throw std::out_of_range("PartitionSelector: level exceeds the maximum tree depth");
    }
    if (agents.getAgentCount() != accumulators.getAgentCount()) {
        throw std::invalid_argument("PartitionSelector: agent store and accumulator buffer sizes differ");
    }

    SelectParams params;
    params.planePosition = plane.position;
    params.planeNormal = plane.normal;
    params.level = level;
    params.mask = mask;
    params.agentCount = accumulators.getAgentCount();
    params.slotCount = accumulators.getSlotCount();

    agents.markDirty();
    m_device.dispatch(m_selectKernel, {}, { accumulators.getHandle(), agents.getReadBuffer() },
        groupCountFor(params.slotCount, config::LOCAL_GROUP_WIDTH), params);
    m_device.barrier();
}

void PartitionSelector::select(AgentStore& agents, AccumulatorBuffer& accumulators,
                               uint32_t level, uint32_t mask, const Group& parent)
{
    select(agents, accumulators, level, mask, BoidKernels::planeFromGroup(parent));
}
