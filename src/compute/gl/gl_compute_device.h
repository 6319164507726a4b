#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <glad/glad.h>

#include "../compute_device.h"
#include "../../core/config.h"

class Shader;

/**
 * GlComputeDevice - OpenGL 4.6 compute backend
 *
 * Buffers are shader storage buffers; kernels are compute shader programs loaded
 * from <shaderDirectory><name>.comp. Push constants travel in a uniform buffer
 * bound at uniform binding 0. barrier() issues glMemoryBarrier for storage,
 * uniform and buffer-update access.
 *
 * Requires a current OpenGL 4.6 context with the function pointers loaded
 * (see GlComputeContext); every call must come from that context's thread.
 */
class GlComputeDevice : public ComputeDevice {
public:
    explicit GlComputeDevice(std::string shaderDirectory = config::SHADER_DIRECTORY);
    ~GlComputeDevice() override;

    GlComputeDevice(const GlComputeDevice&) = delete;
    GlComputeDevice& operator=(const GlComputeDevice&) = delete;

    const char* getName() const override { return "GlComputeDevice"; }

    void releaseBuffer(BufferHandle& buffer) override;
    KernelHandle loadKernel(const std::string& name) override;
    void dispatchRaw(const KernelHandle& kernel,
                     const std::vector<BufferHandle>& inputs,
                     const std::vector<BufferHandle>& outputs,
                     uint32_t groupCount,
                     const void* pushConstants,
                     size_t pushConstantSize) override;
    void barrier() override;

protected:
    BufferHandle allocateBytes(size_t sizeBytes) override;
    void writeBytes(const BufferHandle& buffer, size_t offset, const void* data, size_t sizeBytes) override;
    void readBytes(const BufferHandle& buffer, size_t offset, void* data, size_t sizeBytes) override;

private:
    struct LoadedKernel {
        std::string name;
        std::unique_ptr<Shader> shader;
    };

    void checkGLError(const char* operation) const;
    void checkRange(const BufferHandle& buffer, size_t offset, size_t sizeBytes, const char* operation) const;

    std::string m_shaderDirectory;

    // Owned SSBOs, keyed by GL name
    std::unordered_map<GLuint, size_t> m_buffers;

    std::vector<LoadedKernel> m_kernels;           // KernelHandle id = index + 1
    std::unordered_map<std::string, uint32_t> m_kernelIds;

    GLuint m_pushConstantBuffer = 0;
    size_t m_pushConstantCapacity = 0;
    GLint m_maxStorageBindings = 0;
};
