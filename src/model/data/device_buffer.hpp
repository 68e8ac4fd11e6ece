#ifndef MODEL_DATA_DEVICE_BUFFER_H
#define MODEL_DATA_DEVICE_BUFFER_H
#include "../../tools/gpu.hpp"
#include <utility>

template <typename T> class DeviceBuffer {
  public:
    DeviceBuffer(size_t size = 0) : size_(size) {
        if (size_ == 0)
            return;
        CUDA_THROW(alloc_gpu(&data_, size_));
    }

    DeviceBuffer(DeviceBuffer const &) = delete;
    DeviceBuffer const &operator=(DeviceBuffer const &) = delete;

    DeviceBuffer(DeviceBuffer &&other) {
        std::swap(this->data_, other.data_);
        std::swap(this->size_, other.size_);
    }

    DeviceBuffer &operator=(DeviceBuffer &&other) {
        std::swap(this->data_, other.data_);
        std::swap(this->size_, other.size_);
        return *this;
    }

    ~DeviceBuffer() { release(); }

    T const *data() const { return data_; }
    T *data() { return data_; }
    size_t size() const { return size_; }

    void release() {
        if (data_ == nullptr)
            return;
        CUDA_CHECK(cudaFree(data_));
        data_ = nullptr;
        size_ = 0;
    }

  public:
    // assums that the host array has the proper size
    auto from_host(T const *host) {
        return memcpy_host_to_gpu(data_, host, size_);
    }

    auto from_host(T const *host, cudaStream_t stream) {
        return memcpy_host_to_gpu_async(data_, host, size_, stream);
    }

    // assums that the host array has the proper size
    auto to_host(T *host) { return memcpy_gpu_to_host(host, data_, size_); }

    auto to_host(T *host, cudaStream_t stream) {
        return memcpy_gpu_to_host_async(host, data_, size_, stream);
    }

    auto zero() { return memset_gpu(data_, size_, 0); }

    auto zero(cudaStream_t stream) {
        return memset_gpu_async(data_, size_, 0, stream);
    }

  private:
    T *data_ = nullptr;
    size_t size_ = 0;
};

#endif
