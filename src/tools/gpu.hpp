#ifndef TOOLS_GPU_H
#define TOOLS_GPU_H
#include "errors.hpp"
#include "log.h/log.h"
#include <cuda.h>
#include <cuda_runtime_api.h>
#include <iostream>
#include <nvrtc.h>

/******************************************************************************/
/*                          check macros (log only)                           */
/******************************************************************************/

#define CUDA_CHECK(expr)                                                       \
    {                                                                          \
        auto _result = expr;                                                   \
        if (_result != cudaSuccess) {                                          \
            std::cerr << "[CUDA_ERROR]: " __FILE__ ":" << __LINE__ << ": "     \
                      << cudaGetErrorString(_result) << std::endl;             \
        }                                                                      \
    }

#define CU_CHECK(expr)                                                         \
    {                                                                          \
        auto _result = expr;                                                   \
        if (_result != CUDA_SUCCESS) {                                         \
            std::cerr << "[CU_ERROR]: " __FILE__ ":" << __LINE__ << ": "       \
                      << cu_error_string(_result) << std::endl;                \
        }                                                                      \
    }

#define NVRTC_CHECK(expr)                                                      \
    {                                                                          \
        auto _result = expr;                                                   \
        if (_result != NVRTC_SUCCESS) {                                        \
            std::cerr << "[NVRTC_ERROR]: " __FILE__ ":" << __LINE__ << ": "    \
                      << nvrtcGetErrorString(_result) << std::endl;            \
        }                                                                      \
    }

/******************************************************************************/
/*                     throw macros (raise a DeviceFault)                     */
/******************************************************************************/

#define CUDA_THROW(expr)                                                       \
    {                                                                          \
        auto _result = expr;                                                   \
        if (_result != cudaSuccess) {                                          \
            throw DeviceFault(error_location(__FILE__, __LINE__,               \
                                             cudaGetErrorString(_result)));    \
        }                                                                      \
    }

#define CU_THROW(expr)                                                         \
    {                                                                          \
        auto _result = expr;                                                   \
        if (_result != CUDA_SUCCESS) {                                         \
            throw DeviceFault(error_location(__FILE__, __LINE__,               \
                                             cu_error_string(_result)));       \
        }                                                                      \
    }

#define NVRTC_THROW(expr)                                                      \
    {                                                                          \
        auto _result = expr;                                                   \
        if (_result != NVRTC_SUCCESS) {                                        \
            throw DeviceFault(error_location(__FILE__, __LINE__,               \
                                             nvrtcGetErrorString(_result)));   \
        }                                                                      \
    }

inline char const *cu_error_string(CUresult result) {
    char const *msg = nullptr;

    if (cuGetErrorString(result, &msg) != CUDA_SUCCESS || msg == nullptr) {
        return "unknown driver error";
    }
    return msg;
}

/******************************************************************************/
/*                               memory helpers                               */
/******************************************************************************/

template <typename T>
auto memcpy_host_to_gpu(T *dest_gpu, T const *src_host, size_t size) {
    return cudaMemcpy(dest_gpu, src_host, size * sizeof(T),
                      cudaMemcpyHostToDevice);
}

template <typename T>
auto memcpy_gpu_to_host(T *dest_host, T const *src_gpu, size_t size) {
    return cudaMemcpy(dest_host, src_gpu, size * sizeof(T),
                      cudaMemcpyDeviceToHost);
}

template <typename T>
auto memcpy_host_to_gpu_async(T *dest_gpu, T const *src_host, size_t size,
                              cudaStream_t stream) {
    return cudaMemcpyAsync(dest_gpu, src_host, size * sizeof(T),
                           cudaMemcpyHostToDevice, stream);
}

template <typename T>
auto memcpy_gpu_to_host_async(T *dest_host, T const *src_gpu, size_t size,
                              cudaStream_t stream) {
    return cudaMemcpyAsync(dest_host, src_gpu, size * sizeof(T),
                           cudaMemcpyDeviceToHost, stream);
}

template <typename T> auto alloc_gpu(T **dest, size_t size) {
    return cudaMalloc((void **)dest, size * sizeof(T));
}

template <typename T> auto memset_gpu(T *dest, size_t size, int value) {
    return cudaMemset(dest, value, size * sizeof(T));
}

template <typename T>
auto memset_gpu_async(T *dest, size_t size, int value, cudaStream_t stream) {
    return cudaMemsetAsync(dest, value, size * sizeof(T), stream);
}

#endif
