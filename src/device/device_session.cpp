#include "device_session.hpp"
#include "../tools/gpu.hpp"
#include <cuda_runtime_api.h>
#include <log.h/log.h>

std::ostream &operator<<(std::ostream &os, device_info_t const &info) {
    os << "device " << info.id << ": " << info.name << " (compute "
       << info.compute_major << "." << info.compute_minor << ", "
       << info.global_memory / (1024 * 1024) << " MiB, "
       << info.multiprocessors << " SMs, " << info.max_threads_per_block
       << " threads per block)";
    return os;
}

std::unique_ptr<DeviceSession> DeviceSession::acquire(int device_id) {
    int nb_devices = 0;
    cudaError_t status = cudaGetDeviceCount(&nb_devices);

    if (status == cudaErrorNoDevice || status == cudaErrorInsufficientDriver) {
        throw UnsupportedBackend(std::string("no CUDA capable device: ") +
                                 cudaGetErrorString(status));
    }
    if (status == cudaSuccess && nb_devices == 0) {
        throw UnsupportedBackend("no CUDA capable device: the driver reports "
                                 "0 devices.");
    }
    if (status != cudaSuccess) {
        throw NoAdapter(std::string("cannot enumerate the CUDA devices: ") +
                        cudaGetErrorString(status));
    }
    if (device_id < 0 || device_id >= nb_devices) {
        throw NoAdapter("device " + std::to_string(device_id) +
                        " does not exist (" + std::to_string(nb_devices) +
                        " devices found).");
    }

    if ((status = cudaSetDevice(device_id)) != cudaSuccess ||
        (status = cudaFree(nullptr)) != cudaSuccess) {
        throw NoAdapter("cannot select device " + std::to_string(device_id) +
                        ": " + cudaGetErrorString(status));
    }

    cudaDeviceProp prop;
    if ((status = cudaGetDeviceProperties(&prop, device_id)) != cudaSuccess) {
        throw NoAdapter("cannot query device " + std::to_string(device_id) +
                        ": " + cudaGetErrorString(status));
    }

    // driver side handle used to load the compiled kernels
    CUdevice device = 0;
    CUcontext context = nullptr;
    CUresult result = CUDA_SUCCESS;

    if ((result = cuInit(0)) != CUDA_SUCCESS ||
        (result = cuDeviceGet(&device, device_id)) != CUDA_SUCCESS ||
        (result = cuDevicePrimaryCtxRetain(&context, device)) !=
            CUDA_SUCCESS) {
        throw NoAdapter("cannot create a context on device " +
                        std::to_string(device_id) + ": " +
                        cu_error_string(result));
    }

    device_info_t info = {
        .id = device_id,
        .name = prop.name,
        .compute_major = prop.major,
        .compute_minor = prop.minor,
        .global_memory = prop.totalGlobalMem,
        .multiprocessors = prop.multiProcessorCount,
        .max_threads_per_block = prop.maxThreadsPerBlock,
    };
    INFO_GRP("acquired " << info, INFO_GRP_SESSION);

    return std::unique_ptr<DeviceSession>(
        new DeviceSession(std::move(info), device, context));
}

DeviceSession::~DeviceSession() {
    if (context_ == nullptr)
        return;
    CU_CHECK(cuDevicePrimaryCtxRelease(device_));
    INFO_GRP("released device " << info_.id, INFO_GRP_SESSION);
}

void DeviceSession::make_current() const {
    CU_THROW(cuCtxSetCurrent(context_));
}
