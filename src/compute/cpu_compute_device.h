#pragma once

#include <functional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "compute_device.h"

/**
 * CPU Compute Device - Host reference backend
 *
 * Buffers are plain host byte arrays and kernels are C++ callables invoked once
 * per global invocation id. Large dispatches are split across worker threads;
 * the join at the end of dispatchRaw() doubles as the barrier, so barrier() has
 * nothing left to do.
 *
 * Kernels must be registered before they can be loaded.
 */
class CpuComputeDevice : public ComputeDevice {
public:
    // View of one bound storage buffer
    template<typename T>
    struct BufferView {
        T* data = nullptr;
        size_t count = 0;

        T& operator[](size_t index) const { return data[index]; }
    };

    // Everything one kernel invocation can see
    class Invocation {
    public:
        Invocation(uint32_t globalId,
                   const std::vector<std::vector<unsigned char>*>& bindings,
                   const void* pushConstants)
            : m_globalId(globalId), m_bindings(bindings), m_pushConstants(pushConstants) {}

        uint32_t globalId() const { return m_globalId; }

        template<typename T>
        BufferView<T> binding(size_t slot) const
        {
            if (slot >= m_bindings.size()) {
                throw ComputeDeviceError("CpuComputeDevice: kernel accessed unbound storage slot " + std::to_string(slot));
            }
            std::vector<unsigned char>& storage = *m_bindings[slot];
            return BufferView<T>{ reinterpret_cast<T*>(storage.data()), storage.size() / sizeof(T) };
        }

        template<typename P>
        const P& pushConstants() const
        {
            return *static_cast<const P*>(m_pushConstants);
        }

    private:
        uint32_t m_globalId;
        const std::vector<std::vector<unsigned char>*>& m_bindings;
        const void* m_pushConstants;
    };

    using KernelFunction = std::function<void(const Invocation&)>;

    CpuComputeDevice();
    ~CpuComputeDevice() override;

    const char* getName() const override { return "CpuComputeDevice"; }

    // Kernel registration (host equivalent of compiling a shader)
    void registerKernel(const std::string& name, uint32_t localSize, size_t pushConstantSize, KernelFunction function);
    bool hasKernel(const std::string& name) const;

    void releaseBuffer(BufferHandle& buffer) override;
    KernelHandle loadKernel(const std::string& name) override;
    void dispatchRaw(const KernelHandle& kernel,
                     const std::vector<BufferHandle>& inputs,
                     const std::vector<BufferHandle>& outputs,
                     uint32_t groupCount,
                     const void* pushConstants,
                     size_t pushConstantSize) override;
    void barrier() override {}

    // Performance monitoring
    size_t getDispatchCount() const { return m_dispatchCount; }
    size_t getLiveBufferCount() const { return m_buffers.size(); }

protected:
    BufferHandle allocateBytes(size_t sizeBytes) override;
    void writeBytes(const BufferHandle& buffer, size_t offset, const void* data, size_t sizeBytes) override;
    void readBytes(const BufferHandle& buffer, size_t offset, void* data, size_t sizeBytes) override;

    // Launches one dispatch worker; throws std::system_error when no thread can be started
    virtual std::thread startWorker(std::function<void()> task);

private:
    struct RegisteredKernel {
        std::string name;
        uint32_t localSize = 1;
        size_t pushConstantSize = 0;
        KernelFunction function;
    };

    std::vector<unsigned char>& storageFor(const BufferHandle& buffer, const char* operation);
    void checkRange(const BufferHandle& buffer, size_t offset, size_t sizeBytes, const char* operation);
    void runInvocations(const RegisteredKernel& kernel,
                        uint32_t invocationCount,
                        const std::vector<std::vector<unsigned char>*>& bindings,
                        const void* pushConstants);
    int resolveThreadCount(uint32_t invocationCount) const;

    std::unordered_map<uint32_t, std::vector<unsigned char>> m_buffers;
    uint32_t m_nextBufferId = 1;

    std::vector<RegisteredKernel> m_kernels;          // KernelHandle id = index + 1
    std::unordered_map<std::string, uint32_t> m_kernelIds;

    size_t m_dispatchCount = 0;
};
