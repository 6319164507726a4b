#include "boid_kernels.h"
#include "../../compute/cpu_compute_device.h"
#include "../../core/config.h"
#include <cmath>

namespace BoidKernels {

namespace {

    // normalize() that maps a zero vector to zero instead of NaN
    glm::vec3 normalizeOrZero(const glm::vec3& v)
    {
        float length = glm::length(v);
        return length > 0.0f ? v / length : glm::vec3(0.0f);
    }

} // namespace

bool isFinite(const glm::vec3& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

glm::vec3 planeNormalFromHeading(const glm::vec3& heading)
{
    float length = glm::length(heading);
    if (!(length > 1e-6f)) {
        return glm::vec3(1.0f, 0.0f, 0.0f);
    }

    glm::vec3 direction = heading / length;
    const glm::vec3 axes[3] = {
        glm::vec3(0.0f, 1.0f, 0.0f),
        glm::vec3(0.0f, 0.0f, 1.0f),
        glm::vec3(1.0f, 0.0f, 0.0f),
    };

    for (const glm::vec3& axis : axes) {
        if (std::abs(glm::dot(direction, axis)) <= config::PLANE_AXIS_PARALLEL_THRESHOLD) {
            return glm::normalize(glm::cross(direction, axis));
        }
    }

    // Unreachable for a unit vector: it cannot be parallel to all three axes
    return glm::vec3(1.0f, 0.0f, 0.0f);
}

SeparatingPlane planeFromGroup(const Group& group)
{
    SeparatingPlane plane;
    plane.position = group.center;
    plane.normal = planeNormalFromHeading(group.heading);
    return plane;
}

std::optional<Group> groupFromAccumulator(const AccumulatorHalf& half)
{
    if (half.count == 0) {
        return std::nullopt;
    }

    float count = static_cast<float>(half.count);
    Group group;
    group.center = half.positionSum / count;
    group.heading = half.headingSum / count;
    group.count = half.count;
    return group;
}

void setupSlot(uint32_t index, const SetupParams& params, Boid* boids, Accumulator& slot)
{
    slot = Accumulator{};
    if (index >= params.agentCount) return; // Padding slot

    Boid& boid = boids[index];
    boid.level = 0;
    boid.mask = 0;

    slot.left.positionSum = boid.position;
    slot.left.headingSum = boid.heading;
    slot.left.count = 1;
}

void selectSlot(uint32_t index, const SelectParams& params, Boid* boids, Accumulator& slot)
{
    // Every slot is reset so that only boids of the split node contribute
    slot = Accumulator{};
    if (index >= params.agentCount) return;

    Boid& boid = boids[index];
    if (!boid.hasTag(params.level, params.mask)) return;

    bool side = glm::dot(boid.position - params.planePosition, params.planeNormal) > 0.0f;

    boid.level = params.level + 1;
    boid.mask = params.mask | (side ? (1u << params.level) : 0u);

    AccumulatorHalf& half = side ? slot.left : slot.right;
    half.positionSum = boid.position;
    half.headingSum = boid.heading;
    half.count = 1;
}

void reduceSlot(uint32_t invocation, const ReduceParams& params, Accumulator* slots)
{
    uint64_t span = 2ull * params.stride;
    uint64_t target = span * invocation;
    uint64_t source = target + params.stride;
    if (source >= params.slotCount) return;

    slots[target] += slots[source];
}

glm::vec3 steerHeading(const Boid& boid, const Group* groups, uint32_t groupCount, const MotionParams& params)
{
    if (groupCount == 0) {
        return boid.heading;
    }

    glm::vec3 towardSum(0.0f);
    glm::vec3 headingSum(0.0f);
    float distanceSum = 0.0f;

    for (uint32_t i = 0; i < groupCount; ++i) {
        glm::vec3 offset = groups[i].center - boid.position;
        distanceSum += glm::length(offset);
        towardSum += normalizeOrZero(offset);
        headingSum += normalizeOrZero(groups[i].heading);
    }

    float n = static_cast<float>(groupCount);
    glm::vec3 towardMean = towardSum / n;
    glm::vec3 headingMean = headingSum / n;
    float distanceMean = distanceSum / n;

    float cohesion = glm::clamp(params.cohesionRadius - distanceMean, 0.0f, 1.0f);
    glm::vec3 blend = glm::mix(glm::cross(boid.heading, towardMean), towardMean, cohesion);

    glm::vec3 heading = glm::normalize(boid.heading + params.steerWeight * blend + params.alignWeight * headingMean);

    // Everything cancelled out: keep flying straight
    if (!isFinite(heading)) {
        return boid.heading;
    }
    return heading;
}

Boid integrateBoid(const Boid& boid, const Group* groups, uint32_t groupCount, const MotionParams& params)
{
    Boid next = boid;
    next.heading = steerHeading(boid, groups, groupCount, params);
    next.position = boid.position + next.heading * params.speed;
    return next;
}

void registerBoidKernels(CpuComputeDevice& device)
{
    using Invocation = CpuComputeDevice::Invocation;
    const uint32_t localSize = config::LOCAL_GROUP_WIDTH;

    // setup: [0] accumulators (out), [1] boids (out)
    device.registerKernel(config::SETUP_KERNEL, localSize, sizeof(SetupParams), [](const Invocation& inv) {
        const SetupParams& params = inv.pushConstants<SetupParams>();
        auto slots = inv.binding<Accumulator>(0);
        auto boids = inv.binding<Boid>(1);
        uint32_t id = inv.globalId();
        if (id >= params.slotCount || id >= slots.count) return;
        if (id < params.agentCount && id >= boids.count) {
            throw ComputeDeviceError("setup kernel: boid buffer smaller than agent count");
        }
        setupSlot(id, params, boids.data, slots[id]);
    });

    // select: [0] accumulators (out), [1] boids (out)
    device.registerKernel(config::SELECT_KERNEL, localSize, sizeof(SelectParams), [](const Invocation& inv) {
        const SelectParams& params = inv.pushConstants<SelectParams>();
        auto slots = inv.binding<Accumulator>(0);
        auto boids = inv.binding<Boid>(1);
        uint32_t id = inv.globalId();
        if (id >= params.slotCount || id >= slots.count) return;
        if (id < params.agentCount && id >= boids.count) {
            throw ComputeDeviceError("select kernel: boid buffer smaller than agent count");
        }
        selectSlot(id, params, boids.data, slots[id]);
    });

    // reduce: [0] accumulators (in/out)
    device.registerKernel(config::REDUCE_KERNEL, localSize, sizeof(ReduceParams), [](const Invocation& inv) {
        const ReduceParams& params = inv.pushConstants<ReduceParams>();
        auto slots = inv.binding<Accumulator>(0);
        if (params.slotCount > slots.count) {
            throw ComputeDeviceError("reduce kernel: slot count exceeds accumulator buffer");
        }
        reduceSlot(inv.globalId(), params, slots.data);
    });

    // motion: [0] groups (in), [1] boids read (in), [2] boids write (out)
    device.registerKernel(config::MOTION_KERNEL, localSize, sizeof(MotionParams), [](const Invocation& inv) {
        const MotionParams& params = inv.pushConstants<MotionParams>();
        auto groups = inv.binding<Group>(0);
        auto source = inv.binding<Boid>(1);
        auto target = inv.binding<Boid>(2);
        uint32_t id = inv.globalId();
        if (id >= params.agentCount) return;
        if (id >= source.count || id >= target.count || params.groupCount > groups.count) {
            throw ComputeDeviceError("motion kernel: binding smaller than dispatch parameters");
        }
        target[id] = integrateBoid(source[id], groups.data, params.groupCount, params);
    });
}

} // namespace BoidKernels
