#include "gl_compute_device.h"
#include "gl_timer.h"
#include "../../rendering/core/shader_class.h"
#include <algorithm>
#include <iostream>

GlComputeDevice::GlComputeDevice(std::string shaderDirectory)
    : m_shaderDirectory(std::move(shaderDirectory))
{
    // DSA buffer calls need 4.5, compute shaders 4.3
    if (!GLAD_GL_VERSION_4_5) {
        throw ComputeDeviceError("GlComputeDevice: no current OpenGL 4.5+ context (was glad loaded?)");
    }

    glGetIntegerv(GL_MAX_SHADER_STORAGE_BUFFER_BINDINGS, &m_maxStorageBindings);

    m_pushConstantCapacity = 256;
    glCreateBuffers(1, &m_pushConstantBuffer);
    glNamedBufferData(m_pushConstantBuffer, m_pushConstantCapacity, nullptr, GL_DYNAMIC_DRAW);
    checkGLError("push constant buffer creation");

    std::cout << "GlComputeDevice: " << glGetString(GL_RENDERER) << ", "
              << m_maxStorageBindings << " storage buffer bindings\n";
}

GlComputeDevice::~GlComputeDevice()
{
    m_kernels.clear();

    for (const auto& [id, size] : m_buffers) {
        glDeleteBuffers(1, &id);
    }
    m_buffers.clear();

    if (m_pushConstantBuffer != 0) {
        glDeleteBuffers(1, &m_pushConstantBuffer);
        m_pushConstantBuffer = 0;
    }
}

void GlComputeDevice::checkGLError(const char* operation) const
{
    GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        std::cerr << "OpenGL error after " << operation << ": " << error << "\n";
        throw ComputeDeviceError(std::string("GlComputeDevice: OpenGL error ") + std::to_string(error) +
            " after " + operation);
    }
}

void GlComputeDevice::checkRange(const BufferHandle& buffer, size_t offset, size_t sizeBytes, const char* operation) const
{
    auto it = m_buffers.find(buffer.id);
    if (!buffer.isValid() || it == m_buffers.end()) {
        throw ComputeDeviceError(std::string("GlComputeDevice: ") + operation +
            " on invalid or released buffer " + std::to_string(buffer.id));
    }
    if (offset > it->second || sizeBytes > it->second - offset) {
        throw ComputeDeviceError(std::string("GlComputeDevice: ") + operation + " of " + std::to_string(sizeBytes) +
            " bytes at offset " + std::to_string(offset) + " exceeds buffer size " + std::to_string(it->second));
    }
}

BufferHandle GlComputeDevice::allocateBytes(size_t sizeBytes)
{
    GLuint id = 0;
    glCreateBuffers(1, &id);
    glNamedBufferData(id,
        static_cast<GLsizeiptr>(std::max<size_t>(sizeBytes, 16)),
        nullptr,
        GL_DYNAMIC_COPY);  // Written by compute shaders, read back by the CPU on demand

    // Storage starts zeroed like the host backend
    glClearNamedBufferData(id, GL_R8UI, GL_RED_INTEGER, GL_UNSIGNED_BYTE, nullptr);
    try {
        checkGLError("buffer allocation");
    }
    catch (const ComputeDeviceError&) {
        glDeleteBuffers(1, &id);
        throw;
    }

    m_buffers[id] = sizeBytes;
    return BufferHandle{ id, sizeBytes };
}

void GlComputeDevice::releaseBuffer(BufferHandle& buffer)
{
    if (!buffer.isValid()) return;

    auto it = m_buffers.find(buffer.id);
    if (it != m_buffers.end()) {
        glDeleteBuffers(1, &buffer.id);
        m_buffers.erase(it);
    }
    buffer = BufferHandle{};
}

void GlComputeDevice::writeBytes(const BufferHandle& buffer, size_t offset, const void* data, size_t sizeBytes)
{
    checkRange(buffer, offset, sizeBytes, "write");
    if (sizeBytes == 0) return;

    glNamedBufferSubData(buffer.id, static_cast<GLintptr>(offset), static_cast<GLsizeiptr>(sizeBytes), data);
    checkGLError("buffer write");
}

void GlComputeDevice::readBytes(const BufferHandle& buffer, size_t offset, void* data, size_t sizeBytes)
{
    checkRange(buffer, offset, sizeBytes, "read");
    if (sizeBytes == 0) return;

    glGetNamedBufferSubData(buffer.id, static_cast<GLintptr>(offset), static_cast<GLsizeiptr>(sizeBytes), data);
    checkGLError("buffer read");
}

KernelHandle GlComputeDevice::loadKernel(const std::string& name)
{
    auto existing = m_kernelIds.find(name);
    if (existing != m_kernelIds.end()) {
        return KernelHandle{ existing->second };
    }

    std::string path = m_shaderDirectory + name + ".comp";
    std::unique_ptr<Shader> shader;
    try {
        shader = std::make_unique<Shader>(path.c_str());
    }
    catch (const std::runtime_error& e) {
        throw ComputeDeviceError(std::string("GlComputeDevice: cannot load kernel '") + name + "': " + e.what());
    }

    if (shader->getLocalSizeX() != config::LOCAL_GROUP_WIDTH) {
        throw ComputeDeviceError("GlComputeDevice: kernel '" + name + "' declares local_size_x " +
            std::to_string(shader->getLocalSizeX()) + ", expected " + std::to_string(config::LOCAL_GROUP_WIDTH));
    }

    m_kernels.push_back(LoadedKernel{ name, std::move(shader) });
    uint32_t id = static_cast<uint32_t>(m_kernels.size());
    m_kernelIds[name] = id;
    return KernelHandle{ id };
}

void GlComputeDevice::dispatchRaw(const KernelHandle& kernel,
                                  const std::vector<BufferHandle>& inputs,
                                  const std::vector<BufferHandle>& outputs,
                                  uint32_t groupCount,
                                  const void* pushConstants,
                                  size_t pushConstantSize)
{
    if (!kernel.isValid() || kernel.id > m_kernels.size()) {
        throw ComputeDeviceError("GlComputeDevice: dispatch of invalid kernel handle " + std::to_string(kernel.id));
    }
    const LoadedKernel& loaded = m_kernels[kernel.id - 1];

    if (static_cast<GLint>(inputs.size() + outputs.size()) > m_maxStorageBindings) {
        throw ComputeDeviceError("GlComputeDevice: kernel '" + loaded.name + "' binds more storage buffers than supported");
    }

    // Grow the push constant block when a larger record comes along
    if (pushConstantSize > m_pushConstantCapacity) {
        m_pushConstantCapacity = pushConstantSize;
        glNamedBufferData(m_pushConstantBuffer, static_cast<GLsizeiptr>(m_pushConstantCapacity), nullptr, GL_DYNAMIC_DRAW);
    }
    if (pushConstantSize > 0) {
        glNamedBufferSubData(m_pushConstantBuffer, 0, static_cast<GLsizeiptr>(pushConstantSize), pushConstants);
    }

    loaded.shader->use();
    glBindBufferBase(GL_UNIFORM_BUFFER, 0, m_pushConstantBuffer);

    // Inputs then outputs on consecutive storage bindings
    GLuint binding = 0;
    for (const BufferHandle& buffer : inputs) {
        checkRange(buffer, 0, 0, "dispatch input binding");
        glBindBufferBase(GL_SHADER_STORAGE_BUFFER, binding++, buffer.id);
    }
    for (const BufferHandle& buffer : outputs) {
        checkRange(buffer, 0, 0, "dispatch output binding");
        glBindBufferBase(GL_SHADER_STORAGE_BUFFER, binding++, buffer.id);
    }

    if (groupCount > 0) {
        std::unique_ptr<TimerGPU> timer;
        if (config::enableGpuTimers) {
            timer = std::make_unique<TimerGPU>(loaded.name.c_str());
        }
        loaded.shader->dispatch(groupCount, 1, 1);
    }

    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    checkGLError(loaded.name.c_str());
}

void GlComputeDevice::barrier()
{
    glMemoryBarrier(GL_SHADER_STORAGE_BARRIER_BIT | GL_UNIFORM_BARRIER_BIT | GL_BUFFER_UPDATE_BARRIER_BIT);
}
