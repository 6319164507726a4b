#pragma once

#include <cstdint>

#include "boid_structs.h"
#include "../../compute/compute_device.h"

class AccumulatorBuffer;

/**
 * ParallelReducer - Folds an accumulator buffer into slot 0
 *
 * Pass k uses stride 2^k: invocation i adds slot (2i+1)*stride into slot 2i*stride.
 * Strides double until they reach the slot count, so a buffer of N slots takes
 * ceil(log2 N) passes. Each pass reads what the previous one wrote, so a device
 * barrier separates consecutive passes.
 */
class ParallelReducer {
public:
    explicit ParallelReducer(ComputeDevice& device);

    // Runs every pass and returns the aggregate held in slot 0
    Accumulator reduce(AccumulatorBuffer& buffer);

    static uint32_t passCountFor(uint32_t slotCount);

    uint32_t getLastPassCount() const { return m_lastPassCount; }

private:
    ComputeDevice& m_device;
    KernelHandle m_reduceKernel{};
    uint32_t m_lastPassCount = 0;
};
