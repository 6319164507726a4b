#include "timer.h"
#include <algorithm>
#include <iomanip>
#include <map>

void TimerStats::addSample(float timeMs)
{
	lastTimeMs = timeMs;
	totalTimeMs += timeMs;
	maxTimeMs = std::max(maxTimeMs, timeMs);
	tickCount++;
}

void TimerStats::finalizeFrame()
{
	if (tickCount > 0)
		averageTimeMs = totalTimeMs / tickCount;
	else
		averageTimeMs = 0.0f;
}

void TimerManager::addSample(const std::string& name, float timeMs)
{
	timers[name].addSample(timeMs);
}

void TimerManager::finalizeFrame()
{
	for (auto& [_, timer] : timers)
	{
		timer.finalizeFrame();
	}
}

const TimerStats* TimerManager::getStats(const std::string& name) const
{
	auto it = timers.find(name);
	return it == timers.end() ? nullptr : &it->second;
}

void TimerManager::printReport(std::ostream& out)
{
	finalizeFrame();

	// Sorted by name so reports are stable between runs
	std::map<std::string, TimerStats*> ordered;
	for (auto& [name, timer] : timers)
	{
		ordered[name] = &timer;
	}

	out << "Performance Monitor\n";
	out << std::fixed << std::setprecision(3);
	for (auto& [name, timer] : ordered)
	{
		out << name << ":\n"
			<< "	Last " << timer->lastTimeMs << " ms\n"
			<< "	Avg " << timer->averageTimeMs << " ms\n"
			<< "	Max " << timer->maxTimeMs << " ms\n"
			<< "	Total " << timer->totalTimeMs << " ms\n"
			<< "	Ticks " << timer->tickCount << "\n";
		timer->tickCount = 0;
		timer->totalTimeMs = 0.0f;
	}
	out << std::defaultfloat;
}
