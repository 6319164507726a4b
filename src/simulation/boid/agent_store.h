#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "boid_structs.h"
#include "../../compute/compute_device.h"

/**
 * AgentStore - Canonical boid population
 *
 * Holds two device buffers of boids. Kernels that update boids in place (setup,
 * select) work on the read buffer; the motion pass reads the read buffer, writes
 * the write buffer, then the two are rotated.
 *
 * The host copy is a snapshot. It goes stale as soon as a step is dispatched and
 * is pulled back from the device once, on the first read after that.
 */
class AgentStore {
public:
    AgentStore(ComputeDevice& device, uint32_t agentCount);
    ~AgentStore();

    AgentStore(const AgentStore&) = delete;
    AgentStore& operator=(const AgentStore&) = delete;

    // Randomizes positions inside [-halfExtent, halfExtent]^3 with uniform unit headings
    void reset(float halfExtent, std::optional<uint32_t> seed = std::nullopt);

    // Replaces the population (size must equal the agent count)
    void setBoids(const std::vector<Boid>& boids);

    // Host snapshot of the latest device state
    const std::vector<Boid>& getBoids();

    // Called whenever a dispatch may have written boids
    void markDirty() { m_dirty = true; }
    bool isDirty() const { return m_dirty; }

    // Buffer rotation and access
    void rotateBuffers() { m_rotation = (m_rotation + 1) % 2; }
    BufferHandle getReadBuffer() const { return m_buffers[m_rotation]; }
    BufferHandle getWriteBuffer() const { return m_buffers[(m_rotation + 1) % 2]; }

    uint32_t getAgentCount() const { return m_agentCount; }
    size_t getSyncCount() const { return m_syncCount; }

    static std::vector<Boid> randomBoids(uint32_t count, float halfExtent, std::optional<uint32_t> seed);

private:
    void syncFromDevice();

    ComputeDevice& m_device;
    uint32_t m_agentCount;

    BufferHandle m_buffers[2]{};
    int m_rotation = 0;

    std::vector<Boid> m_hostBoids;
    bool m_dirty = false;
    size_t m_syncCount = 0;
};
