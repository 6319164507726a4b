#pragma once
#include <cstdint>
#include <glm/glm.hpp>

#include "../../core/config.h"

// GPU boid structure matching the compute shaders (std430)
// The partition tag (level, mask) is stored inline: bit i of mask records the side
// of the level-i separating plane the boid fell on, level counts the valid bits.
struct alignas(16) Boid {
    glm::vec3 position{ 0.0f };
    uint32_t level{ 0 };
    glm::vec3 heading{ 0.0f, 1.0f, 0.0f };
    uint32_t mask{ 0 };

    bool hasTag(uint32_t tagLevel, uint32_t tagMask) const
    {
        return level == tagLevel && mask == tagMask;
    }
};
static_assert(sizeof(Boid) == 32, "Boid must be exactly 32 bytes (2 vec3s + level + mask)");

// Partial sums for one side of a split
struct alignas(16) AccumulatorHalf {
    glm::vec3 positionSum{ 0.0f };
    uint32_t count{ 0 };
    glm::vec3 headingSum{ 0.0f };
    uint32_t _padding{ 0 };

    AccumulatorHalf& operator+=(const AccumulatorHalf& other)
    {
        positionSum += other.positionSum;
        headingSum += other.headingSum;
        count += other.count;
        return *this;
    }
};
static_assert(sizeof(AccumulatorHalf) == 32, "AccumulatorHalf must be 32 bytes to match std430 layout");

// One slot per boid. left collects boids on the positive side of the plane, right the rest.
struct alignas(16) Accumulator {
    AccumulatorHalf left{};
    AccumulatorHalf right{};

    Accumulator& operator+=(const Accumulator& other)
    {
        left += other.left;
        right += other.right;
        return *this;
    }
};
static_assert(sizeof(Accumulator) == 64, "Accumulator must be 64 bytes (two halves)");

// Centroid and mean heading of the boids in one tree node
struct alignas(16) Group {
    glm::vec3 center{ 0.0f };
    uint32_t count{ 0 };
    glm::vec3 heading{ 0.0f };
    uint32_t _padding{ 0 };
};
static_assert(sizeof(Group) == 32, "Group must be 32 bytes to match std430 layout");

struct SeparatingPlane {
    glm::vec3 position{ 0.0f };
    glm::vec3 normal{ 1.0f, 0.0f, 0.0f };
};

// ========== Kernel push constants (std140 uniform block at binding 0) ==========

struct alignas(16) SetupParams {
    uint32_t agentCount{ 0 };
    uint32_t slotCount{ 0 };
    uint32_t _padding[2]{ 0, 0 };
};
static_assert(sizeof(SetupParams) == 16, "SetupParams must be 16 bytes");

struct alignas(16) SelectParams {
    glm::vec3 planePosition{ 0.0f };
    uint32_t mask{ 0 };
    glm::vec3 planeNormal{ 1.0f, 0.0f, 0.0f };
    uint32_t level{ 0 };
    uint32_t agentCount{ 0 };
    uint32_t slotCount{ 0 };
    uint32_t _padding[2]{ 0, 0 };
};
static_assert(sizeof(SelectParams) == 48, "SelectParams must be 48 bytes to match the std140 block");

struct alignas(16) ReduceParams {
    uint32_t stride{ 1 };
    uint32_t slotCount{ 0 };
    uint32_t _padding[2]{ 0, 0 };
};
static_assert(sizeof(ReduceParams) == 16, "ReduceParams must be 16 bytes");

struct alignas(16) MotionParams {
    uint32_t groupCount{ 0 };
    float speed{ config::DEFAULT_SPEED };
    float cohesionRadius{ config::DEFAULT_COHESION_RADIUS };
    float steerWeight{ config::DEFAULT_STEER_WEIGHT };
    float alignWeight{ config::DEFAULT_ALIGN_WEIGHT };
    uint32_t agentCount{ 0 };
    uint32_t _padding[2]{ 0, 0 };
};
static_assert(sizeof(MotionParams) == 32, "MotionParams must be 32 bytes to match the std140 block");
