#include "gl_context.h"
#include "../../core/config.h"
#include <iostream>
#include <stdexcept>

void glfwErrorCallback(int error, const char* description)
{
    std::cerr << "GLFW Error " << error << ": " << description << "\n";
}

GlComputeContext::GlComputeContext()
{
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit())
    {
        throw std::runtime_error("Failed to initialize GLFW");
    }

#ifndef NDEBUG // If we are in debug mode, we want to enable the debug context
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GL_TRUE);
#endif

    // Compute shaders and DSA buffers need OpenGL 4.5+, core profile
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, config::OPENGL_VERSION_MAJOR);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, config::OPENGL_VERSION_MINOR);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);

    window = glfwCreateWindow(64, 64, config::APPLICATION_NAME, NULL, NULL);
    if (window == NULL)
    {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window for an OpenGL 4.6 context");
    }
    glfwMakeContextCurrent(window);

    // Load GLAD so it configures OpenGL
    int version = gladLoadGL(glfwGetProcAddress);
    if (!version)
    {
        glfwDestroyWindow(window);
        glfwTerminate();
        window = nullptr;
        throw std::runtime_error("Failed to initialize GLAD");
    }
    glVersionMajor = GLAD_VERSION_MAJOR(version);
    glVersionMinor = GLAD_VERSION_MINOR(version);
    std::cout << "GlComputeContext: GL " << glVersionMajor << "." << glVersionMinor << "\n";

#ifndef NDEBUG
    int flags;
    glGetIntegerv(GL_CONTEXT_FLAGS, &flags);
    if (flags & GL_CONTEXT_FLAG_DEBUG_BIT)
    {
        glEnable(GL_DEBUG_OUTPUT);
        glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
        glDebugMessageCallback(glDebugOutput, nullptr);
        glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr, GL_TRUE);
    }
#endif
}

GlComputeContext::~GlComputeContext()
{
    if (window)
    {
        glfwDestroyWindow(window);
        glfwTerminate();
    }
}

void APIENTRY glDebugOutput(GLenum source,
                            GLenum type,
                            unsigned int id,
                            GLenum severity,
                            GLsizei length,
                            const char* message,
                            const void* userParam)
{
    // ignore non-significant error/warning codes
    if (id == 131169 || id == 131185 || id == 131218 || id == 131204)
        return;
    if (severity == GL_DEBUG_SEVERITY_NOTIFICATION)
        return;

    std::cerr << "GL debug message (" << id << "): " << message << "\n";

    switch (type)
    {
    case GL_DEBUG_TYPE_ERROR:
        std::cerr << "Type: Error";
        break;
    case GL_DEBUG_TYPE_UNDEFINED_BEHAVIOR:
        std::cerr << "Type: Undefined Behaviour";
        break;
    case GL_DEBUG_TYPE_PERFORMANCE:
        std::cerr << "Type: Performance";
        break;
    default:
        std::cerr << "Type: Other";
        break;
    }

    switch (severity)
    {
    case GL_DEBUG_SEVERITY_HIGH:
        std::cerr << ", Severity: high";
        break;
    case GL_DEBUG_SEVERITY_MEDIUM:
        std::cerr << ", Severity: medium";
        break;
    default:
        std::cerr << ", Severity: low";
        break;
    }
    std::cerr << "\n";
}
