#pragma once

#include <cstdint>
#include <vector>

#include "boid_structs.h"
#include "../../compute/compute_device.h"

class AgentStore;
struct SimulationSettings;

struct MotionBehavior {
    float speed{ config::DEFAULT_SPEED };
    float cohesionRadius{ config::DEFAULT_COHESION_RADIUS };
    float steerWeight{ config::DEFAULT_STEER_WEIGHT };
    float alignWeight{ config::DEFAULT_ALIGN_WEIGHT };

    static MotionBehavior fromSettings(const SimulationSettings& settings);
};

/**
 * MotionIntegrator - Steers and moves every boid from the leaf groups
 *
 * Each boid averages, over the present leaf groups, the unit direction to the
 * group centroid, the group's unit mean heading and the distance to the centroid.
 * The closer the mean distance is to within the cohesion radius, the more the steering
 * term turns from heading x direction towards the direction itself. A heading that
 * normalizes to a non-finite vector is discarded. The position then advances along
 * the heading by speed.
 *
 * Reads the store's read buffer, writes its write buffer, then rotates them.
 */
class MotionIntegrator {
public:
    MotionIntegrator(ComputeDevice& device, uint32_t maxGroupCount);
    ~MotionIntegrator();

    MotionIntegrator(const MotionIntegrator&) = delete;
    MotionIntegrator& operator=(const MotionIntegrator&) = delete;

    void integrate(AgentStore& agents, const std::vector<Group>& leafGroups, const MotionBehavior& behavior);

    uint32_t getMaxGroupCount() const { return m_maxGroupCount; }

private:
    ComputeDevice& m_device;
    uint32_t m_maxGroupCount;
    BufferHandle m_groupBuffer{};
    KernelHandle m_motionKernel{};
};
