#include "agent_store.h"
#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

AgentStore::AgentStore(ComputeDevice& device, uint32_t agentCount)
    : m_device(device), m_agentCount(agentCount)
{
    if (agentCount == 0) {
        throw std::invalid_argument("AgentStore requires at least one boid");
    }

    m_buffers[0] = m_device.allocateBuffer<Boid>(agentCount);
    try {
        m_buffers[1] = m_device.allocateBuffer<Boid>(agentCount);
        m_hostBoids.resize(agentCount);
    }
    catch (const std::exception& e) {
        std::cerr << "AgentStore: allocation of " << agentCount << " boids failed: " << e.what() << "\n";
        m_device.releaseBuffer(m_buffers[0]);
        m_device.releaseBuffer(m_buffers[1]);
        throw;
    }
}

AgentStore::~AgentStore()
{
    m_device.releaseBuffer(m_buffers[0]);
    m_device.releaseBuffer(m_buffers[1]);
}

std::vector<Boid> AgentStore::randomBoids(uint32_t count, float halfExtent, std::optional<uint32_t> seed)
{
    std::mt19937 rng(seed ? *seed : std::random_device{}());
    std::uniform_real_distribution<float> cube(-halfExtent, halfExtent);
    std::uniform_real_distribution<float> unit(-1.0f, 1.0f);

    std::vector<Boid> boids(count);
    for (Boid& boid : boids) {
        boid.position = glm::vec3(cube(rng), cube(rng), cube(rng));

        // Rejection sampling inside the unit ball gives uniformly distributed directions
        glm::vec3 heading;
        float lengthSquared;
        do {
            heading = glm::vec3(unit(rng), unit(rng), unit(rng));
            lengthSquared = glm::dot(heading, heading);
        } while (lengthSquared > 1.0f || lengthSquared < 1e-6f);

        boid.heading = heading / std::sqrt(lengthSquared);
        boid.level = 0;
        boid.mask = 0;
    }
    return boids;
}

void AgentStore::reset(float halfExtent, std::optional<uint32_t> seed)
{
    if (!(halfExtent > 0.0f)) {
        throw std::invalid_argument("AgentStore: spawn half extent must be positive");
    }
    setBoids(randomBoids(m_agentCount, halfExtent, seed));
}

void AgentStore::setBoids(const std::vector<Boid>& boids)
{
    if (boids.size() != m_agentCount) {
        throw std::invalid_argument("AgentStore: expected " + std::to_string(m_agentCount) +
            " boids, got " + std::to_string(boids.size()));
    }

    // Both buffers get the population so a rotation never exposes stale boids
    m_device.write(m_buffers[0], boids);
    m_device.write(m_buffers[1], boids);
    m_rotation = 0;

    m_hostBoids = boids;
    m_dirty = false;
}

const std::vector<Boid>& AgentStore::getBoids()
{
    if (m_dirty) {
        syncFromDevice();
    }
    return m_hostBoids;
}

void AgentStore::syncFromDevice()
{
    m_device.barrier();
    m_device.read(getReadBuffer(), m_hostBoids);
    m_dirty = false;
    m_syncCount++;
}
