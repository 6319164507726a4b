#pragma once
#include <cstdint>
#include <string_view>

namespace config
{
	// Application Configuration
	// This namespace contains all configuration constants, default values,
	// and "magic numbers" used throughout the simulation.

	constexpr const char* APPLICATION_NAME{"BoidTree"};

	// ========== Compute Configuration ==========
	constexpr int OPENGL_VERSION_MAJOR{4};
	constexpr int OPENGL_VERSION_MINOR{6};

	// Work group width shared by every boid kernel (local_size_x in the shaders)
	constexpr uint32_t LOCAL_GROUP_WIDTH{16};

	// Kernel names, resolved by the compute device
	constexpr const char* SETUP_KERNEL{"setup"};
	constexpr const char* SELECT_KERNEL{"select"};
	constexpr const char* REDUCE_KERNEL{"reduce"};
	constexpr const char* MOTION_KERNEL{"motion"};

	// Compute shaders are loaded from <SHADER_DIRECTORY><kernel name>.comp
	constexpr const char* SHADER_DIRECTORY{"shaders/boids/"};

	// ========== Boid Simulation Defaults ==========
	constexpr int DEFAULT_AGENT_COUNT{256};        // 16 work groups of 16 boids
	constexpr int DEFAULT_TREE_DEPTH{3};           // 8 leaf groups
	constexpr int MAX_TREE_DEPTH{20};              // The node list holds 2^(depth+1) - 1 groups
	constexpr float DEFAULT_SPEED{0.04f};          // Distance travelled per step along the heading
	constexpr float DEFAULT_COHESION_RADIUS{5.0f}; // Boids closer than this to their neighbours close in, farther ones veer sideways
	constexpr float DEFAULT_STEER_WEIGHT{0.12f};
	constexpr float DEFAULT_ALIGN_WEIGHT{0.12f};
	constexpr float DEFAULT_SPAWN_HALF_EXTENT{10.0f}; // Boids spawn inside [-h, h]^3

	// Headings whose |dot| with an axis exceeds this are treated as parallel to it
	constexpr float PLANE_AXIS_PARALLEL_THRESHOLD{0.99f};

	// ========== Runtime Configuration Variables ==========
	// These can be modified at runtime
	inline bool useMultithreadedKernels{ true };	// Split host kernel dispatches across worker threads
	inline int kernelThreadCount{ 4 };				// Number of worker threads for host dispatches (0 = auto-detect)
	inline int minInvocationsPerThread{ 1024 };		// Smaller dispatches run on the calling thread
	inline bool traceTreeTraversal{ false };		// Log every split while the partition tree is built
	inline bool enableGpuTimers{ false };			// Wrap OpenGL dispatches in GL_TIME_ELAPSED queries
	inline bool logStepTiming{ false };				// Print the duration of every simulation step
}
