#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include <sstream>
#include <vector>

#include "simulation/boid/agent_store.h"
#include "simulation/boid/boid_simulation.h"
#include "utils/timer.h"
#include "test_helpers.h"

namespace {

SimulationSettings seededSettings(uint32_t seed = 42) {
    SimulationSettings settings;
    settings.seed = seed;
    return settings;
}

// Host device whose allocation number failAt (1-based) runs out of memory
class FailingAllocationDevice : public CpuComputeDevice {
public:
    explicit FailingAllocationDevice(int failAt) : m_failAt(failAt) {}

protected:
    BufferHandle allocateBytes(size_t sizeBytes) override {
        if (++m_allocations == m_failAt) {
            throw ComputeDeviceError("out of device memory");
        }
        return CpuComputeDevice::allocateBytes(sizeBytes);
    }

private:
    int m_failAt;
    int m_allocations = 0;
};

} // namespace

class BoidSimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = makeBoidDevice();
    }

    std::unique_ptr<CpuComputeDevice> device;
};

TEST_F(BoidSimulationTest, EndToEndAlignmentOnly) {
    // Two partitions of 8 split along x; no steering, no cohesion
    SimulationSettings settings;
    settings.agentCountHint = 16;
    settings.treeDepth = 1;
    settings.cohesionRadius = 0.0f;
    settings.steerWeight = 0.0f;
    settings.alignWeight = 0.5f;
    settings.speed = 0.1f;
    BoidSimulation sim(*device, settings);

    const glm::vec3 forward(0.0f, 0.0f, 1.0f);
    const glm::vec3 climbing = glm::normalize(glm::vec3(0.0f, 1.0f, 1.0f));

    std::vector<Boid> boids;
    for (int i = 0; i < 8; ++i) boids.push_back(makeBoid(glm::vec3(-1.0f, 0.0f, 0.0f), forward));
    for (int i = 0; i < 8; ++i) boids.push_back(makeBoid(glm::vec3(1.0f, 0.0f, 0.0f), climbing));
    sim.setBoids(boids);

    sim.step();

    const std::vector<Group>& leaves = sim.getLeafGroups();
    ASSERT_EQ(leaves.size(), 2u);
    for (const Group& leaf : leaves) {
        EXPECT_EQ(leaf.count, 8u);
        EXPECT_NEAR(std::abs(leaf.center.x), 1.0f, 1e-6f);
    }

    // Every boid aligns with the average of the two partitions' unit headings
    glm::vec3 meanHeading = (forward + climbing) * 0.5f;
    const std::vector<Boid>& moved = sim.getBoids();
    for (size_t i = 0; i < moved.size(); ++i) {
        glm::vec3 expected = glm::normalize(boids[i].heading + 0.5f * meanHeading);
        EXPECT_VEC3_NEAR(expected, moved[i].heading, 1e-5f);
        EXPECT_VEC3_NEAR(boids[i].position + expected * 0.1f, moved[i].position, 1e-5f);
    }
}

TEST_F(BoidSimulationTest, EndToEndAntiparallel) {
    // Opposite headings cancel at the root, which then splits along +X
    SimulationSettings settings;
    settings.agentCountHint = 16;
    settings.treeDepth = 1;
    settings.cohesionRadius = 0.0f;
    settings.steerWeight = 0.0f;
    settings.alignWeight = 0.5f;
    settings.speed = 0.1f;
    BoidSimulation sim(*device, settings);

    const glm::vec3 forward(0.0f, 0.0f, 1.0f);
    const glm::vec3 backward(0.0f, 0.0f, -1.0f);

    std::vector<Boid> boids;
    for (int i = 0; i < 8; ++i) boids.push_back(makeBoid(glm::vec3(-1.0f, 0.0f, 0.0f), forward));
    for (int i = 0; i < 8; ++i) boids.push_back(makeBoid(glm::vec3(1.0f, 0.0f, 0.0f), backward));
    sim.setBoids(boids);

    sim.step();

    const std::vector<Group>& leaves = sim.getLeafGroups();
    ASSERT_EQ(leaves.size(), 2u);
    for (const Group& leaf : leaves) {
        EXPECT_EQ(leaf.count, 8u);
        EXPECT_NEAR(std::abs(leaf.center.x), 1.0f, 1e-6f);
    }

    // The leaf headings cancel too, so nobody turns
    const std::vector<Boid>& moved = sim.getBoids();
    for (size_t i = 0; i < moved.size(); ++i) {
        EXPECT_VEC3_NEAR(boids[i].heading, moved[i].heading, 1e-6f);
        EXPECT_VEC3_NEAR(boids[i].position + boids[i].heading * 0.1f, moved[i].position, 1e-6f);

        uint32_t side = boids[i].position.x > 0.0f ? 1u : 0u;
        EXPECT_TRUE(moved[i].hasTag(1, side)) << "boid " << i;
    }
}

TEST_F(BoidSimulationTest, LeafGroupsCoverPopulation) {
    BoidSimulation sim(*device, seededSettings());

    for (int step = 0; step < 5; ++step) {
        sim.step();

        uint64_t covered = 0;
        for (const Group& leaf : sim.getLeafGroups()) covered += leaf.count;
        EXPECT_LE(covered, sim.getAgentCount());
        EXPECT_EQ(covered, sim.getPartitionTree().getLeafPopulation());
        if (sim.getTreeBuilder().getSkippedSplitCount() == 0) {
            EXPECT_EQ(covered, sim.getAgentCount());
        }
        EXPECT_LE(sim.getLeafGroups().size(), size_t(1) << sim.getSettings().treeDepth);
    }
    EXPECT_EQ(sim.getStepCount(), 5u);
}

TEST_F(BoidSimulationTest, HeadingsStayUnitAndFinite) {
    BoidSimulation sim(*device, seededSettings(3));
    for (int step = 0; step < 20; ++step) sim.step();

    for (const Boid& boid : sim.getBoids()) {
        EXPECT_TRUE(BoidKernels::isFinite(boid.position));
        EXPECT_TRUE(BoidKernels::isFinite(boid.heading));
        EXPECT_NEAR(glm::length(boid.heading), 1.0f, 1e-4f);
    }
}

TEST_F(BoidSimulationTest, SnapshotSyncsLazily) {
    BoidSimulation sim(*device, seededSettings());
    EXPECT_FALSE(sim.isBoidSnapshotStale());
    sim.getBoids();
    EXPECT_EQ(sim.getBoidSyncCount(), 0u);

    sim.step();
    EXPECT_TRUE(sim.isBoidSnapshotStale());

    std::vector<Boid> first = sim.getBoids();
    std::vector<Boid> second = sim.getBoids();
    EXPECT_EQ(sim.getBoidSyncCount(), 1u);
    EXPECT_FALSE(sim.isBoidSnapshotStale());
    ASSERT_EQ(first.size(), second.size());
    EXPECT_VEC3_NEAR(first[0].position, second[0].position, 0.0f);

    sim.step();
    sim.getBoids();
    EXPECT_EQ(sim.getBoidSyncCount(), 2u);
}

TEST_F(BoidSimulationTest, RejectsInvalidConfiguration) {
    SimulationSettings settings;
    settings.treeDepth = 0;
    EXPECT_THROW({ BoidSimulation sim(*device, settings); }, std::invalid_argument);

    settings = SimulationSettings{};
    settings.agentCountHint = 0;
    EXPECT_THROW({ BoidSimulation sim(*device, settings); }, std::invalid_argument);

    settings = SimulationSettings{};
    settings.treeDepth = config::MAX_TREE_DEPTH + 1;
    EXPECT_THROW({ BoidSimulation sim(*device, settings); }, std::invalid_argument);

    // Rejected before any device allocation
    EXPECT_EQ(device->getLiveBufferCount(), 0u);
}

TEST_F(BoidSimulationTest, MissingKernelsFailConstruction) {
    CpuComputeDevice bare;
    EXPECT_THROW({ BoidSimulation sim(bare, seededSettings()); }, ComputeDeviceError);
    EXPECT_EQ(bare.getLiveBufferCount(), 0u);
}

TEST_F(BoidSimulationTest, DeviceFailureAbortsStep) {
    BoidSimulation sim(*device, seededSettings());

    // Same handle, failing body
    device->registerKernel(config::MOTION_KERNEL, config::LOCAL_GROUP_WIDTH, sizeof(MotionParams),
        [](const CpuComputeDevice::Invocation&) {
            throw ComputeDeviceError("motion kernel lost");
        });

    EXPECT_THROW(sim.step(), ComputeDeviceError);
    EXPECT_EQ(sim.getStepCount(), 0u);
}

TEST_F(BoidSimulationTest, FailedStepKeepsPreviousLeafGroups) {
    BoidSimulation sim(*device, seededSettings());
    sim.step();

    std::vector<Group> before = sim.getLeafGroups();
    uint64_t populationBefore = sim.getPartitionTree().getLeafPopulation();
    ASSERT_FALSE(before.empty());

    // Tree build runs, motion fails
    device->registerKernel(config::MOTION_KERNEL, config::LOCAL_GROUP_WIDTH, sizeof(MotionParams),
        [](const CpuComputeDevice::Invocation&) {
            throw ComputeDeviceError("motion kernel lost");
        });

    EXPECT_THROW(sim.step(), ComputeDeviceError);
    EXPECT_EQ(sim.getStepCount(), 1u);

    const std::vector<Group>& after = sim.getLeafGroups();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(after[i].count, before[i].count);
        EXPECT_VEC3_NEAR(before[i].center, after[i].center, 0.0f);
        EXPECT_VEC3_NEAR(before[i].heading, after[i].heading, 0.0f);
    }
    EXPECT_EQ(sim.getPartitionTree().getLeafPopulation(), populationBefore);
}

TEST(AgentStore, FailedAllocationReleasesFirstBuffer) {
    FailingAllocationDevice device(2);
    EXPECT_THROW({ AgentStore store(device, 16); }, ComputeDeviceError);
    EXPECT_EQ(device.getLiveBufferCount(), 0u);
}

TEST_F(BoidSimulationTest, AgentCountRoundsUp) {
    SimulationSettings settings = seededSettings();
    settings.agentCountHint = 100;
    BoidSimulation sim(*device, settings);

    EXPECT_EQ(sim.getAgentCount(), 112u);
    EXPECT_EQ(sim.getSlotCount(), 128u);
    EXPECT_EQ(sim.getBoids().size(), 112u);

    sim.step();
    EXPECT_EQ(sim.getPartitionTree().getLeafPopulation(), 112u);
}

TEST_F(BoidSimulationTest, SeededResetIsReproducible) {
    BoidSimulation sim(*device, seededSettings(5));
    std::vector<Boid> initial = sim.getBoids();

    sim.step();
    sim.reset();
    std::vector<Boid> again = sim.getBoids();
    ASSERT_EQ(initial.size(), again.size());
    for (size_t i = 0; i < initial.size(); ++i) {
        EXPECT_VEC3_NEAR(initial[i].position, again[i].position, 0.0f);
        EXPECT_VEC3_NEAR(initial[i].heading, again[i].heading, 0.0f);
    }
    EXPECT_TRUE(sim.getLeafGroups().empty());

    sim.reset(6u);
    EXPECT_NE(sim.getBoids()[0].position.x, initial[0].position.x);
}

TEST_F(BoidSimulationTest, ResetSpawnsInsideCube) {
    SimulationSettings settings = seededSettings(9);
    settings.spawnHalfExtent = 2.0f;
    BoidSimulation sim(*device, settings);

    for (const Boid& boid : sim.getBoids()) {
        EXPECT_LE(std::abs(boid.position.x), 2.0f);
        EXPECT_LE(std::abs(boid.position.y), 2.0f);
        EXPECT_LE(std::abs(boid.position.z), 2.0f);
        EXPECT_NEAR(glm::length(boid.heading), 1.0f, 1e-5f);
        EXPECT_TRUE(boid.hasTag(0, 0));
    }
}

TEST_F(BoidSimulationTest, SetBoidsRejectsWrongSize) {
    BoidSimulation sim(*device, seededSettings());
    EXPECT_THROW(sim.setBoids(std::vector<Boid>(3)), std::invalid_argument);
}

TEST_F(BoidSimulationTest, SeparatingPlanesFollowInternalNodes) {
    BoidSimulation sim(*device, seededSettings());
    EXPECT_TRUE(sim.getSeparatingPlanes().empty());

    sim.step();
    std::vector<SeparatingPlane> planes = sim.getSeparatingPlanes();
    EXPECT_EQ(planes.size(), sim.getTreeBuilder().getSplitCount());
    for (const SeparatingPlane& plane : planes) {
        EXPECT_NEAR(glm::length(plane.normal), 1.0f, 1e-5f);
    }
}

TEST_F(BoidSimulationTest, ThreadedHostMatchesSerial) {
    std::vector<Boid> serial, threaded;
    {
        ThreadingOverride threading(false, 1, 1024);
        auto serialDevice = makeBoidDevice();
        BoidSimulation sim(*serialDevice, seededSettings(77));
        for (int i = 0; i < 3; ++i) sim.step();
        serial = sim.getBoids();
    }
    {
        ThreadingOverride threading(true, 4, 16);
        auto threadedDevice = makeBoidDevice();
        BoidSimulation sim(*threadedDevice, seededSettings(77));
        for (int i = 0; i < 3; ++i) sim.step();
        threaded = sim.getBoids();
    }

    ASSERT_EQ(serial.size(), threaded.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        EXPECT_VEC3_NEAR(serial[i].position, threaded[i].position, 0.0f);
        EXPECT_VEC3_NEAR(serial[i].heading, threaded[i].heading, 0.0f);
    }
}

TEST_F(BoidSimulationTest, ReleasesDeviceBuffers) {
    {
        BoidSimulation sim(*device, seededSettings());
        sim.step();
        // Two boid buffers, the accumulators and the leaf groups
        EXPECT_EQ(device->getLiveBufferCount(), 4u);
    }
    EXPECT_EQ(device->getLiveBufferCount(), 0u);
}

TEST_F(BoidSimulationTest, StepIsTimed) {
    bool previous = config::logStepTiming;
    config::logStepTiming = true;

    std::ostringstream output;
    std::streambuf* old = std::cout.rdbuf(output.rdbuf());
    {
        BoidSimulation sim(*device, seededSettings());
        sim.step();
    }
    std::cout.rdbuf(old);
    config::logStepTiming = previous;

    EXPECT_NE(output.str().find("256 boid sim took"), std::string::npos);
    const TimerStats* stats = TimerManager::instance().getStats("Boid Step");
    ASSERT_NE(stats, nullptr);
    EXPECT_GE(stats->tickCount, 1);
}
