#pragma once
#include <chrono>
#include <ostream>
#include <string>
#include <unordered_map>

struct TimerStats {
	float lastTimeMs = 0.0f;
	float totalTimeMs = 0.0f;
	float averageTimeMs = 0.0f;
	float maxTimeMs = 0.0f;

	int tickCount = 0;

	void addSample(float timeMs);
	void finalizeFrame();
};


class TimerManager {
public:
	static TimerManager& instance() {
		static TimerManager inst;
		return inst;
	}

	void addSample(const std::string& name, float timeMs);
	void finalizeFrame();

	// Returns nullptr for timers that never recorded a sample
	const TimerStats* getStats(const std::string& name) const;

	// Prints every timer and starts a new accumulation window
	void printReport(std::ostream& out);
	void clear() { timers.clear(); }

private:
	std::unordered_map<std::string, TimerStats> timers;
};

// Records the lifetime of the scope under the given name
class TimerCPU {
public:
	TimerCPU(const char* name) : name(name) {
		start = std::chrono::steady_clock::now();
	}

	~TimerCPU() {
		TimerManager::instance().addSample(name, elapsedMs());
	}

	float elapsedMs() const {
		auto end = std::chrono::steady_clock::now();
		return std::chrono::duration<float, std::milli>(end - start).count();
	}

private:
	const char* name;
	std::chrono::steady_clock::time_point start;
};
