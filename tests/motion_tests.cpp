#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "simulation/boid/agent_store.h"
#include "simulation/boid/motion_integrator.h"
#include "simulation/boid/simulation_settings.h"
#include "test_helpers.h"

namespace {

MotionParams paramsFor(float steer, float align, float cohesionRadius, float speed = 0.1f) {
    MotionParams params;
    params.speed = speed;
    params.cohesionRadius = cohesionRadius;
    params.steerWeight = steer;
    params.alignWeight = align;
    return params;
}

} // namespace

TEST(SteerHeading, NoGroupsKeepsHeading) {
    Boid boid = makeBoid(glm::vec3(1.0f), glm::vec3(0.0f, 0.6f, 0.8f));
    MotionParams params = paramsFor(0.5f, 0.5f, 5.0f);

    glm::vec3 heading = BoidKernels::steerHeading(boid, nullptr, 0, params);
    EXPECT_VEC3_NEAR(boid.heading, heading, 0.0f);

    Boid next = BoidKernels::integrateBoid(boid, nullptr, 0, params);
    EXPECT_VEC3_NEAR(boid.position + boid.heading * 0.1f, next.position, 1e-6f);
}

TEST(SteerHeading, CancellingTermsKeepHeading) {
    // Group straight behind, flying backwards: heading + blend + alignment sums to zero
    Boid boid = makeBoid(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    Group group = makeGroup(glm::vec3(0.0f, 0.0f, -10.0f), glm::vec3(0.0f, 0.0f, -1.0f));
    MotionParams params = paramsFor(0.5f, 0.5f, 100.0f);

    glm::vec3 heading = BoidKernels::steerHeading(boid, &group, 1, params);
    EXPECT_TRUE(BoidKernels::isFinite(heading));
    EXPECT_VEC3_NEAR(boid.heading, heading, 0.0f);

    Boid next = BoidKernels::integrateBoid(boid, &group, 1, params);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 0.0f, 0.1f), next.position, 1e-6f);
}

TEST(SteerHeading, DistantGroupSteersSideways) {
    // Beyond the cohesion radius the blend is heading x direction-to-group
    Boid boid = makeBoid(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    Group group = makeGroup(glm::vec3(10.0f, 0.0f, 0.0f), glm::vec3(0.0f, 2.0f, 0.0f));
    MotionParams params = paramsFor(0.12f, 0.12f, 0.0f);

    glm::vec3 expected = glm::normalize(glm::vec3(0.0f, 0.24f, 1.0f));
    EXPECT_VEC3_NEAR(expected, BoidKernels::steerHeading(boid, &group, 1, params), 1e-6f);
}

TEST(SteerHeading, NearbyGroupSteersTowardsIt) {
    // Within the cohesion radius the blend is the direction to the group itself
    Boid boid = makeBoid(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    Group group = makeGroup(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, 3.0f));
    MotionParams params = paramsFor(0.2f, 0.1f, 5.0f);

    glm::vec3 expected = glm::normalize(glm::vec3(0.2f, 0.0f, 1.1f));
    EXPECT_VEC3_NEAR(expected, BoidKernels::steerHeading(boid, &group, 1, params), 1e-6f);
}

TEST(SteerHeading, DegenerateGroupsStayFinite) {
    // A group at the boid's own position with no mean heading contributes nothing
    Boid boid = makeBoid(glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    Group groups[2] = {
        makeGroup(glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(0.0f)),
        makeGroup(glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f)),
    };
    MotionParams params = paramsFor(0.3f, 0.4f, 5.0f);

    glm::vec3 heading = BoidKernels::steerHeading(boid, groups, 2, params);
    EXPECT_TRUE(BoidKernels::isFinite(heading));
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 0.0f, 0.0f), heading, 1e-6f);
}

TEST(SteerHeading, AveragesOverGroups) {
    Boid boid = makeBoid(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    Group groups[2] = {
        makeGroup(glm::vec3(0.0f, 50.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f)),
        makeGroup(glm::vec3(0.0f, -50.0f, 0.0f), glm::vec3(-1.0f, 0.0f, 0.0f)),
    };
    // Directions and headings cancel pairwise: no steering at all
    MotionParams params = paramsFor(0.5f, 0.5f, 1.0f);
    EXPECT_VEC3_NEAR(boid.heading, BoidKernels::steerHeading(boid, groups, 2, params), 1e-6f);
}

class MotionIntegratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = makeBoidDevice();
    }

    std::unique_ptr<CpuComputeDevice> device;
};

TEST_F(MotionIntegratorTest, EmptyGroupListMovesStraight) {
    AgentStore agents(*device, 16);
    std::vector<Boid> boids = AgentStore::randomBoids(16, 3.0f, 21u);
    agents.setBoids(boids);

    MotionIntegrator motion(*device, 8);
    MotionBehavior behavior;
    behavior.speed = 0.5f;
    motion.integrate(agents, {}, behavior);

    const std::vector<Boid>& moved = agents.getBoids();
    ASSERT_EQ(moved.size(), boids.size());
    for (size_t i = 0; i < boids.size(); ++i) {
        EXPECT_VEC3_NEAR(boids[i].heading, moved[i].heading, 0.0f);
        EXPECT_VEC3_NEAR(boids[i].position + boids[i].heading * 0.5f, moved[i].position, 1e-6f);
    }
}

TEST_F(MotionIntegratorTest, MatchesKernelBodyAndRotatesBuffers) {
    AgentStore agents(*device, 32);
    std::vector<Boid> boids = AgentStore::randomBoids(32, 4.0f, 8u);
    agents.setBoids(boids);

    std::vector<Group> groups = {
        makeGroup(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), 10),
        makeGroup(glm::vec3(-2.0f, 3.0f, 1.0f), glm::vec3(0.5f, 0.0f, 0.5f), 22),
    };
    MotionBehavior behavior;
    MotionParams params = paramsFor(behavior.steerWeight, behavior.alignWeight, behavior.cohesionRadius, behavior.speed);

    BufferHandle before = agents.getReadBuffer();
    MotionIntegrator motion(*device, 4);
    motion.integrate(agents, groups, behavior);
    EXPECT_NE(agents.getReadBuffer().id, before.id);

    const std::vector<Boid>& moved = agents.getBoids();
    for (size_t i = 0; i < boids.size(); ++i) {
        Boid expected = BoidKernels::integrateBoid(boids[i], groups.data(), 2, params);
        EXPECT_VEC3_NEAR(expected.heading, moved[i].heading, 1e-6f);
        EXPECT_VEC3_NEAR(expected.position, moved[i].position, 1e-6f);
        EXPECT_NEAR(glm::length(moved[i].heading), 1.0f, 1e-5f);
    }
}

TEST_F(MotionIntegratorTest, RejectsTooManyGroups) {
    AgentStore agents(*device, 16);
    MotionIntegrator motion(*device, 2);
    std::vector<Group> groups(3, makeGroup(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f)));
    EXPECT_THROW(motion.integrate(agents, groups, MotionBehavior{}), std::length_error);
}

TEST(MotionBehavior, CopiesSettings) {
    SimulationSettings settings;
    settings.speed = 1.5f;
    settings.cohesionRadius = 2.5f;
    settings.steerWeight = 0.25f;
    settings.alignWeight = 0.75f;

    MotionBehavior behavior = MotionBehavior::fromSettings(settings);
    EXPECT_FLOAT_EQ(behavior.speed, 1.5f);
    EXPECT_FLOAT_EQ(behavior.cohesionRadius, 2.5f);
    EXPECT_FLOAT_EQ(behavior.steerWeight, 0.25f);
    EXPECT_FLOAT_EQ(behavior.alignWeight, 0.75f);
}
