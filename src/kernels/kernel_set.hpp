#ifndef KERNELS_KERNEL_SET_H
#define KERNELS_KERNEL_SET_H
#include "../model/data/network_config.hpp"
#include "../model/data/parameter_store.hpp"
#include <cuda.h>
#include <cuda_runtime_api.h>
#include <string>

/*
 * Compiles the network kernels for the given configuration and returns the
 * resulting PTX. `arch` is the compute capability of the target device
 * (major * 10 + minor).
 */
std::string compile_network_kernels(NetworkConfig const &config, int arch);

/*
 * Forward and backward programs of one configuration, loaded in the current
 * context. The module is unloaded on destruction.
 */
class KernelSet {
  public:
    KernelSet(NetworkConfig const &config, std::string const &ptx);

    KernelSet(KernelSet const &) = delete;
    KernelSet const &operator=(KernelSet const &) = delete;

    ~KernelSet();

  public:
    // the launches are asynchronous, the caller synchronizes the stream
    void forward(ParameterStore &store, cudaStream_t stream) const;
    void backward(ParameterStore &store, cudaStream_t stream) const;

    NetworkConfig const &config() const { return config_; }
    unsigned int work_items() const { return work_items_; }

  private:
    void check_store(ParameterStore const &store) const;

  private:
    NetworkConfig config_;
    unsigned int work_items_ = 0;
    CUmodule module_ = nullptr;
    CUfunction forward_ = nullptr;
    CUfunction backward_ = nullptr;
};

#endif
