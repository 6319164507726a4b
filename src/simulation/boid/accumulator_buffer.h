#pragma once

#include <cstdint>
#include <vector>

#include "boid_structs.h"
#include "../../compute/compute_device.h"

class AgentStore;

/**
 * AccumulatorBuffer - One Accumulator slot per boid, padded to a power of two
 *
 * Slots past the agent count are padding and always hold zero after a setup or
 * select pass, so the stride-doubling reduction never needs a bounds special case.
 * The contents are transient: every setup, select and reduce pass overwrites them.
 */
class AccumulatorBuffer {
public:
    AccumulatorBuffer(ComputeDevice& device, uint32_t agentCount);
    ~AccumulatorBuffer();

    AccumulatorBuffer(const AccumulatorBuffer&) = delete;
    AccumulatorBuffer& operator=(const AccumulatorBuffer&) = delete;

    // Seeds every boid's left half with its own state and clears all tags (setup kernel)
    void seedFromAgents(AgentStore& agents);

    // Direct slot access for tests and debugging
    void writeSlots(const std::vector<Accumulator>& slots);
    std::vector<Accumulator> readSlots();
    Accumulator readSlot(uint32_t index);

    BufferHandle getHandle() const { return m_buffer; }
    uint32_t getAgentCount() const { return m_agentCount; }
    uint32_t getSlotCount() const { return m_slotCount; }

private:
    ComputeDevice& m_device;
    uint32_t m_agentCount;
    uint32_t m_slotCount;
    BufferHandle m_buffer{};
    KernelHandle m_setupKernel{};
};
