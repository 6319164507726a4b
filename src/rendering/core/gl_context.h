#pragma once

#include <glad/glad.h>
#include <GLFW/glfw3.h>

// Hidden GLFW window whose OpenGL 4.6 core context is made current and loaded with glad.
// Compute-only callers (tests, headless runs) use it to acquire a device context;
// destroying it releases the window and terminates GLFW.
// Throws std::runtime_error when no suitable context can be created.
class GlComputeContext
{
public:
	GlComputeContext();
	~GlComputeContext();

	GlComputeContext(const GlComputeContext&) = delete;
	GlComputeContext& operator=(const GlComputeContext&) = delete;

	GLFWwindow* getWindow() const { return window; }

	// Version reported by the loader
	int getGlVersionMajor() const { return glVersionMajor; }
	int getGlVersionMinor() const { return glVersionMinor; }

private:
	GLFWwindow* window = nullptr;
	int glVersionMajor = 0;
	int glVersionMinor = 0;
};

void glfwErrorCallback(int error, const char* description);

void APIENTRY glDebugOutput(GLenum source,
                            GLenum type,
                            unsigned int id,
                            GLenum severity,
                            GLsizei length,
                            const char* message,
                            const void* userParam);
