#include "cpu_compute_device.h"
#include "../core/config.h"
#include <algorithm>
#include <cstring>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>

CpuComputeDevice::CpuComputeDevice() {
    m_kernels.reserve(8);
}

CpuComputeDevice::~CpuComputeDevice() {
    // Cleanup handled by RAII
}

void CpuComputeDevice::registerKernel(const std::string& name, uint32_t localSize, size_t pushConstantSize, KernelFunction function) {
    if (localSize == 0) {
        throw std::invalid_argument("Kernel local size must be at least 1: " + name);
    }
    if (!function) {
        throw std::invalid_argument("Kernel function is empty: " + name);
    }

    auto existing = m_kernelIds.find(name);
    if (existing != m_kernelIds.end()) {
        // Re-registration replaces the kernel but keeps handles stable
        RegisteredKernel& kernel = m_kernels[existing->second - 1];
        kernel.localSize = localSize;
        kernel.pushConstantSize = pushConstantSize;
        kernel.function = std::move(function);
        return;
    }

    m_kernels.push_back(RegisteredKernel{ name, localSize, pushConstantSize, std::move(function) });
    m_kernelIds[name] = static_cast<uint32_t>(m_kernels.size());
}

bool CpuComputeDevice::hasKernel(const std::string& name) const {
    return m_kernelIds.find(name) != m_kernelIds.end();
}

BufferHandle CpuComputeDevice::allocateBytes(size_t sizeBytes) {
    uint32_t id = m_nextBufferId++;
    m_buffers[id] = std::vector<unsigned char>(sizeBytes, 0);
    return BufferHandle{ id, sizeBytes };
}

void CpuComputeDevice::releaseBuffer(BufferHandle& buffer) {
    if (!buffer.isValid()) return;

    m_buffers.erase(buffer.id);
    buffer = BufferHandle{};
}

std::vector<unsigned char>& CpuComputeDevice::storageFor(const BufferHandle& buffer, const char* operation) {
    auto it = m_buffers.find(buffer.id);
    if (!buffer.isValid() || it == m_buffers.end()) {
        throw ComputeDeviceError(std::string("CpuComputeDevice: ") + operation +
            " on invalid or released buffer " + std::to_string(buffer.id));
    }
    return it->second;
}

void CpuComputeDevice::checkRange(const BufferHandle& buffer, size_t offset, size_t sizeBytes, const char* operation) {
    const std::vector<unsigned char>& storage = storageFor(buffer, operation);
    if (offset > storage.size() || sizeBytes > storage.size() - offset) {
        throw ComputeDeviceError(std::string("CpuComputeDevice: ") + operation + " of " + std::to_string(sizeBytes) +
            " bytes at offset " + std::to_string(offset) + " exceeds buffer size " + std::to_string(storage.size()));
    }
}

void CpuComputeDevice::writeBytes(const BufferHandle& buffer, size_t offset, const void* data, size_t sizeBytes) {
    checkRange(buffer, offset, sizeBytes, "write");
    if (sizeBytes == 0) return;

    std::memcpy(m_buffers[buffer.id].data() + offset, data, sizeBytes);
}

void CpuComputeDevice::readBytes(const BufferHandle& buffer, size_t offset, void* data, size_t sizeBytes) {
    checkRange(buffer, offset, sizeBytes, "read");
    if (sizeBytes == 0) return;

    std::memcpy(data, m_buffers[buffer.id].data() + offset, sizeBytes);
}

KernelHandle CpuComputeDevice::loadKernel(const std::string& name) {
    auto it = m_kernelIds.find(name);
    if (it == m_kernelIds.end()) {
        throw ComputeDeviceError("CpuComputeDevice: no kernel registered under the name '" + name + "'");
    }
    return KernelHandle{ it->second };
}

void CpuComputeDevice::dispatchRaw(const KernelHandle& kernel,
                                   const std::vector<BufferHandle>& inputs,
                                   const std::vector<BufferHandle>& outputs,
                                   uint32_t groupCount,
                                   const void* pushConstants,
                                   size_t pushConstantSize) {
    if (!kernel.isValid() || kernel.id > m_kernels.size()) {
        throw ComputeDeviceError("CpuComputeDevice: dispatch of invalid kernel handle " + std::to_string(kernel.id));
    }
    const RegisteredKernel& registered = m_kernels[kernel.id - 1];

    if (pushConstantSize != registered.pushConstantSize) {
        throw ComputeDeviceError("CpuComputeDevice: kernel '" + registered.name + "' expects " +
            std::to_string(registered.pushConstantSize) + " bytes of push constants, got " +
            std::to_string(pushConstantSize));
    }

    // Bind inputs then outputs to consecutive storage slots
    std::vector<std::vector<unsigned char>*> bindings;
    bindings.reserve(inputs.size() + outputs.size());
    for (const BufferHandle& buffer : inputs) {
        bindings.push_back(&storageFor(buffer, "dispatch input binding"));
    }
    for (const BufferHandle& buffer : outputs) {
        bindings.push_back(&storageFor(buffer, "dispatch output binding"));
    }

    // Push constants are captured by value for the duration of the dispatch
    std::vector<unsigned char> constants(pushConstantSize);
    if (pushConstantSize > 0) {
        std::memcpy(constants.data(), pushConstants, pushConstantSize);
    }

    uint32_t invocationCount = groupCount * registered.localSize;
    runInvocations(registered, invocationCount, bindings, constants.data());
    m_dispatchCount++;
}

std::thread CpuComputeDevice::startWorker(std::function<void()> task) {
    return std::thread(std::move(task));
}

int CpuComputeDevice::resolveThreadCount(uint32_t invocationCount) const {
    if (!config::useMultithreadedKernels) return 1;

    int threads = config::kernelThreadCount;
    if (threads <= 0) {
        threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }

    int perThread = std::max(1, config::minInvocationsPerThread);
    int useful = static_cast<int>((invocationCount + perThread - 1) / perThread);
    return std::max(1, std::min(threads, useful));
}

void CpuComputeDevice::runInvocations(const RegisteredKernel& kernel,
                                      uint32_t invocationCount,
                                      const std::vector<std::vector<unsigned char>*>& bindings,
                                      const void* pushConstants) {
    int threadCount = resolveThreadCount(invocationCount);

    if (threadCount <= 1) {
        for (uint32_t id = 0; id < invocationCount; ++id) {
            kernel.function(Invocation(id, bindings, pushConstants));
        }
        return;
    }

    // Contiguous chunks per worker; each worker reports its own failure
    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    std::vector<std::exception_ptr> failures(threadCount);
    uint32_t chunk = (invocationCount + threadCount - 1) / threadCount;

    try {
        for (int t = 0; t < threadCount; ++t) {
            uint32_t begin = std::min(invocationCount, static_cast<uint32_t>(t) * chunk);
            uint32_t end = std::min(invocationCount, begin + chunk);

            workers.push_back(startWorker([&kernel, &bindings, &failures, pushConstants, begin, end, t]() {
                try {
                    for (uint32_t id = begin; id < end; ++id) {
                        kernel.function(Invocation(id, bindings, pushConstants));
                    }
                }
                catch (...) {
                    failures[t] = std::current_exception();
                }
            }));
        }
    }
    catch (const std::system_error& e) {
        // Workers already running still reference this frame
        for (auto& worker : workers) {
            worker.join();
        }
        std::cerr << "CpuComputeDevice: could not start worker threads for kernel '" << kernel.name << "': " << e.what() << "\n";
        throw ComputeDeviceError("CpuComputeDevice: failed to start worker thread for kernel '" + kernel.name + "': " + e.what());
    }

    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::cerr << "CpuComputeDevice: kernel '" << kernel.name << "' failed on a worker thread\n";
            std::rethrow_exception(failure);
        }
    }
}
