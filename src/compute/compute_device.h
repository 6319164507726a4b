#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * ComputeDevice - Narrow interface to a data-parallel compute backend
 *
 * Buffers and kernels are referred to by plain handles. Every dispatch binds its
 * input buffers to storage slots 0..k-1 and its output buffers to slots k..,
 * and receives a small push-constant record by value.
 *
 * Writes made by a dispatch are only guaranteed visible to later dispatches and
 * host reads after barrier(). Any failure throws ComputeDeviceError; the device
 * state is then considered lost.
 */

class ComputeDeviceError : public std::runtime_error {
public:
    explicit ComputeDeviceError(const std::string& message)
        : std::runtime_error(message) {}
};

struct BufferHandle {
    uint32_t id{ 0 };
    size_t sizeBytes{ 0 };

    bool isValid() const { return id != 0; }
};

struct KernelHandle {
    uint32_t id{ 0 };

    bool isValid() const { return id != 0; }
};

class ComputeDevice {
public:
    virtual ~ComputeDevice() = default;

    virtual const char* getName() const = 0;

    // Buffer management
    template<typename T>
    BufferHandle allocateBuffer(size_t count)
    {
        return allocateBytes(count * sizeof(T));
    }

    virtual void releaseBuffer(BufferHandle& buffer) = 0;

    template<typename T>
    void write(const BufferHandle& buffer, const std::vector<T>& data)
    {
        writeBytes(buffer, 0, data.data(), data.size() * sizeof(T));
    }

    // Reads out.size() elements starting at element 0
    template<typename T>
    void read(const BufferHandle& buffer, std::vector<T>& out)
    {
        readBytes(buffer, 0, out.data(), out.size() * sizeof(T));
    }

    template<typename T>
    T readElement(const BufferHandle& buffer, size_t index)
    {
        T value{};
        readBytes(buffer, index * sizeof(T), &value, sizeof(T));
        return value;
    }

    // Kernels
    virtual KernelHandle loadKernel(const std::string& name) = 0;

    template<typename P>
    void dispatch(const KernelHandle& kernel,
                  const std::vector<BufferHandle>& inputs,
                  const std::vector<BufferHandle>& outputs,
                  uint32_t groupCount,
                  const P& pushConstants)
    {
        dispatchRaw(kernel, inputs, outputs, groupCount, &pushConstants, sizeof(P));
    }

    virtual void dispatchRaw(const KernelHandle& kernel,
                             const std::vector<BufferHandle>& inputs,
                             const std::vector<BufferHandle>& outputs,
                             uint32_t groupCount,
                             const void* pushConstants,
                             size_t pushConstantSize) = 0;

    // Makes the writes of every previous dispatch visible
    virtual void barrier() = 0;

protected:
    virtual BufferHandle allocateBytes(size_t sizeBytes) = 0;
    virtual void writeBytes(const BufferHandle& buffer, size_t offset, const void* data, size_t sizeBytes) = 0;
    virtual void readBytes(const BufferHandle& buffer, size_t offset, void* data, size_t sizeBytes) = 0;
};

// Number of work groups of the given width needed to cover invocationCount items
inline uint32_t groupCountFor(uint32_t invocationCount, uint32_t groupWidth)
{
    return (invocationCount + groupWidth - 1) / groupWidth;
}
