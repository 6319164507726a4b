#pragma once

#include <cstdint>
#include <optional>
#include <glm/glm.hpp>

#include "boid_structs.h"

class CpuComputeDevice;

/**
 * Boid Kernels - Host implementations of the four boid compute shaders
 *
 * Each function is the body of one shader invocation and must stay behaviourally
 * identical to its GLSL twin in shaders/boids/. registerBoidKernels() installs
 * them on a CpuComputeDevice under the names in config.h.
 */
namespace BoidKernels {

    // Tree helpers shared by the host-side orchestration

    // Returns a unit normal orthogonal to the heading. Crosses with Y unless the heading is
    // nearly parallel to it, then Z, then X. A zero heading yields +X.
    glm::vec3 planeNormalFromHeading(const glm::vec3& heading);
    SeparatingPlane planeFromGroup(const Group& group);

    // Centroid and mean heading of one accumulator half, absent when it holds no boids
    std::optional<Group> groupFromAccumulator(const AccumulatorHalf& half);

    // Per-invocation bodies
    void setupSlot(uint32_t index, const SetupParams& params, Boid* boids, Accumulator& slot);
    void selectSlot(uint32_t index, const SelectParams& params, Boid* boids, Accumulator& slot);
    void reduceSlot(uint32_t invocation, const ReduceParams& params, Accumulator* slots);

    glm::vec3 steerHeading(const Boid& boid, const Group* groups, uint32_t groupCount, const MotionParams& params);
    Boid integrateBoid(const Boid& boid, const Group* groups, uint32_t groupCount, const MotionParams& params);

    bool isFinite(const glm::vec3& v);

    void registerBoidKernels(CpuComputeDevice& device);

} // namespace BoidKernels
