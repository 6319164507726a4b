#include "accumulator_buffer.h"
#include "agent_store.h"
#include "simulation_settings.h"
#include "../../core/config.h"
#include <stdexcept>
#include <string>

AccumulatorBuffer::AccumulatorBuffer(ComputeDevice& device, uint32_t agentCount)
    : m_device(device), m_agentCount(agentCount), m_slotCount(resolveSlotCount(agentCount))
{
    m_setupKernel = m_device.loadKernel(config::SETUP_KERNEL);
    m_buffer = m_device.allocateBuffer<Accumulator>(m_slotCount);
}

AccumulatorBuffer::~AccumulatorBuffer()
{
    m_device.releaseBuffer(m_buffer);
}

void AccumulatorBuffer::seedFromAgents(AgentStore& agents)
{
    if (agents.getAgentCount() != m_agentCount) {
        throw std::invalid_argument("AccumulatorBuffer: agent store holds " + std::to_string(agents.getAgentCount()) +
            " boids, buffer was sized for " + std::to_string(m_agentCount));
    }

    SetupParams params;
    params.agentCount = m_agentCount;
    params.slotCount = m_slotCount;

    agents.markDirty();
    m_device.dispatch(m_setupKernel, {}, { m_buffer, agents.getReadBuffer() },
        groupCountFor(m_slotCount, config::LOCAL_GROUP_WIDTH), params);
    m_device.barrier();
}

void AccumulatorBuffer::writeSlots(const std::vector<Accumulator>& slots)
{
    if (slots.size() > m_slotCount) {
        throw std::invalid_argument("AccumulatorBuffer: " + std::to_string(slots.size()) +
            " slots do not fit in a buffer of " + std::to_string(m_slotCount));
    }

    // Unspecified slots become zero padding
    std::vector<Accumulator> padded(slots);
    padded.resize(m_slotCount);
    m_device.write(m_buffer, padded);
}

std::vector<Accumulator> AccumulatorBuffer::readSlots()
{
    std::vector<Accumulator> slots(m_slotCount);
    m_device.barrier();
    m_device.read(m_buffer, slots);
    return slots;
}

Accumulator AccumulatorBuffer::readSlot(uint32_t index)
{
    if (index >= m_slotCount) {
        throw std::out_of_range("Accumulator slot index out of range");
    }
    m_device.barrier();
    return m_device.readElement<Accumulator>(m_buffer, index);
}
