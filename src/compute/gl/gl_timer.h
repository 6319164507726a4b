#pragma once
#include <glad/glad.h>

#include "../../utils/timer.h"

// Records the GPU time spent on the commands issued during its lifetime.
// The destructor waits for the query result, so keep it out of hot paths unless profiling.
class TimerGPU {
public:
	TimerGPU(const char* name) : name(name) {
		glGenQueries(1, &query);
		glBeginQuery(GL_TIME_ELAPSED, query);
	}

	~TimerGPU() {
		glEndQuery(GL_TIME_ELAPSED);

		GLuint64 ns = 0;
		glGetQueryObjectui64v(query, GL_QUERY_RESULT, &ns);
		glDeleteQueries(1, &query);

		float ms = ns * 1e-6f;
		TimerManager::instance().addSample(name, ms);
	}

private:
	GLuint query = 0;
	const char* name;
};
