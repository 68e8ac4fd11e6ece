#ifndef DEVICE_DEVICE_SESSION_H
#define DEVICE_DEVICE_SESSION_H
#include <cstddef>
#include <cuda.h>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

struct device_info_t {
    int id = 0;
    std::string name;
    int compute_major = 0;
    int compute_minor = 0;
    size_t global_memory = 0;
    int multiprocessors = 0;
    int max_threads_per_block = 0;
};

std::ostream &operator<<(std::ostream &os, device_info_t const &info);

// target architecture of the kernels (major * 10 + minor)
inline int compute_arch(device_info_t const &info) {
    return info.compute_major * 10 + info.compute_minor;
}

/*
 * Handle on the selected device. The primary context is retained for the
 * lifetime of the session so that the modules loaded by the kernel sets and
 * the buffers of the parameter store stay valid.
 */
class DeviceSession {
  public:
    static std::unique_ptr<DeviceSession> acquire(int device_id = 0);

    DeviceSession(DeviceSession const &) = delete;
    DeviceSession const &operator=(DeviceSession const &) = delete;

    ~DeviceSession();

  public:
    device_info_t const &info() const { return info_; }
    int id() const { return info_.id; }
    CUcontext context() const { return context_; }

    // makes the primary context current on the calling thread
    void make_current() const;

  private:
    DeviceSession(device_info_t info, CUdevice device, CUcontext context)
        : info_(std::move(info)), device_(device), context_(context) {}

  private:
    device_info_t info_;
    CUdevice device_ = 0;
    CUcontext context_ = nullptr;
};

#endif
