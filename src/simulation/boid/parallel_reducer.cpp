#include "parallel_reducer.h"
#include "accumulator_buffer.h"
#include "../../core/config.h"

ParallelReducer::ParallelReducer(ComputeDevice& device)
    : m_device(device)
{
    m_reduceKernel = m_device.loadKernel(config::REDUCE_KERNEL);
}

uint32_t ParallelReducer::passCountFor(uint32_t slotCount)
{
    uint32_t passes = 0;
    for (uint64_t stride = 1; stride < slotCount; stride <<= 1) {
        passes++;
    }
    return passes;
}

Accumulator ParallelReducer::reduce(AccumulatorBuffer& buffer)
{
    const uint32_t slotCount = buffer.getSlotCount();
    m_lastPassCount = 0;

    for (uint64_t stride = 1; stride < slotCount; stride <<= 1) {
        ReduceParams params;
        params.stride = static_cast<uint32_t>(stride);
        params.slotCount = slotCount;

        // One invocation per pair of slots folded in this pass
        uint32_t pairs = static_cast<uint32_t>((slotCount + 2 * stride - 1) / (2 * stride));

        m_device.dispatch(m_reduceKernel, {}, { buffer.getHandle() },
            groupCountFor(pairs, config::LOCAL_GROUP_WIDTH), params);

        // The next pass reads what this one wrote
        m_device.barrier();
        m_lastPassCount++;
    }

    return buffer.readSlot(0);
}
