#include "kernel_set.hpp"
#include "../tools/gpu.hpp"
#include <iomanip>
#include <kernels/network_kernels_source.hpp>
#include <log.h/log.h>
#include <sstream>
#include <vector>

/******************************************************************************/
/*                                compilation                                 */
/******************************************************************************/

static std::string learning_rate_define(ftype learning_rate) {
    std::ostringstream oss;

    // the exponent form is always a valid float literal
    oss << "-DHHXOR_LEARNING_RATE=" << std::scientific << std::setprecision(9)
        << learning_rate << "f";
    return oss.str();
}

static std::string program_log(nvrtcProgram program) {
    size_t log_size = 0;

    if (nvrtcGetProgramLogSize(program, &log_size) != NVRTC_SUCCESS ||
        log_size <= 1) {
        return "";
    }
    std::string log(log_size, '\0');
    if (nvrtcGetProgramLog(program, log.data()) != NVRTC_SUCCESS) {
        return "";
    }
    log.resize(log_size - 1);
    return log;
}

std::string compile_network_kernels(NetworkConfig const &config, int arch) {
    validate_config(config);
    std::vector<std::string> options = {
        "--gpu-architecture=compute_" + std::to_string(arch),
        "-DHHXOR_INPUT_SIZE=" + std::to_string(config.input_size),
        "-DHHXOR_HIDDEN_SIZE=" + std::to_string(config.hidden_size),
        "-DHHXOR_OUTPUT_SIZE=" + std::to_string(config.output_size),
        learning_rate_define(config.learning_rate),
    };
    std::vector<char const *> options_ptrs;
    nvrtcProgram program = nullptr;
    std::string ptx;

    for (auto const &option : options) {
        options_ptrs.push_back(option.c_str());
    }

    INFO_GRP("compiling kernels (" << config.input_size << ", "
                                   << config.hidden_size << ", "
                                   << config.output_size << ", "
                                   << config.learning_rate << ") for compute_"
                                   << arch,
             INFO_GRP_KERNELS);
    NVRTC_THROW(nvrtcCreateProgram(&program, NETWORK_KERNELS_SOURCE,
                                   "network_kernels.cu", 0, nullptr, nullptr));

    nvrtcResult status = nvrtcCompileProgram(program, (int)options_ptrs.size(),
                                             options_ptrs.data());
    if (status != NVRTC_SUCCESS) {
        std::string log = program_log(program);
        NVRTC_CHECK(nvrtcDestroyProgram(&program));
        throw DeviceFault(std::string("kernel compilation failed: ") +
                          nvrtcGetErrorString(status) + "\n" + log);
    }

    size_t ptx_size = 0;
    status = nvrtcGetPTXSize(program, &ptx_size);
    if (status == NVRTC_SUCCESS) {
        ptx.resize(ptx_size);
        status = nvrtcGetPTX(program, ptx.data());
    }
    NVRTC_CHECK(nvrtcDestroyProgram(&program));
    NVRTC_THROW(status);

    return ptx;
}

/******************************************************************************/
/*                                 kernel set                                 */
/******************************************************************************/

KernelSet::KernelSet(NetworkConfig const &config, std::string const &ptx)
    : config_(config), work_items_(::work_items(config)) {
    CU_THROW(cuModuleLoadData(&module_, ptx.c_str()));

    CUresult result = cuModuleGetFunction(&forward_, module_, "hhxor_forward");
    if (result == CUDA_SUCCESS) {
        result = cuModuleGetFunction(&backward_, module_, "hhxor_backward");
    }
    if (result != CUDA_SUCCESS) {
        CU_CHECK(cuModuleUnload(module_));
        throw DeviceFault(std::string("cannot load the network kernels: ") +
                          cu_error_string(result));
    }
    INFO_GRP("kernels loaded (" << work_items_ << " work items)",
             INFO_GRP_KERNELS);
}

KernelSet::~KernelSet() {
    if (module_ == nullptr)
        return;
    CU_CHECK(cuModuleUnload(module_));
}

void KernelSet::check_store(ParameterStore const &store) const {
    if (store.released()) {
        throw std::logic_error(
            "error: kernel launched on a released parameter store.");
    }
    if (!(store.config() == config_)) {
        throw InvalidConfig(
            "the kernels were compiled for another network configuration.");
    }
}

void KernelSet::forward(ParameterStore &store, cudaStream_t stream) const {
    check_store(store);
    auto &buffers = store.buffers();
    ftype const *input = buffers.input.data();
    ftype const *weights_hidden = buffers.weights_hidden.data();
    ftype const *weights_output = buffers.weights_output.data();
    ftype const *bias_hidden = buffers.bias_hidden.data();
    ftype const *bias_output = buffers.bias_output.data();
    ftype *hidden_layer = buffers.hidden_layer.data();
    ftype *output_layer = buffers.output_layer.data();
    void *args[] = {&input,       &weights_hidden, &weights_output,
                    &bias_hidden, &bias_output,    &hidden_layer,
                    &output_layer};

    CU_THROW(cuLaunchKernel(forward_, 1, 1, 1, work_items_, 1, 1, 0,
                            (CUstream)stream, args, nullptr));
}

void KernelSet::backward(ParameterStore &store, cudaStream_t stream) const {
    check_store(store);
    auto &buffers = store.buffers();
    ftype const *input = buffers.input.data();
    ftype const *target = buffers.target.data();
    ftype *weights_hidden = buffers.weights_hidden.data();
    ftype *weights_output = buffers.weights_output.data();
    ftype *bias_hidden = buffers.bias_hidden.data();
    ftype *bias_output = buffers.bias_output.data();
    ftype const *hidden_layer = buffers.hidden_layer.data();
    ftype const *output_layer = buffers.output_layer.data();
    ftype *hidden_gradients = buffers.hidden_gradients.data();
    ftype *output_gradients = buffers.output_gradients.data();
    ftype *loss = buffers.loss.data();
    void *args[] = {&input,           &target,           &weights_hidden,
                    &weights_output,  &bias_hidden,      &bias_output,
                    &hidden_layer,    &output_layer,     &hidden_gradients,
                    &output_gradients, &loss};

    CU_THROW(cuLaunchKernel(backward_, 1, 1, 1, work_items_, 1, 1, 0,
                            (CUstream)stream, args, nullptr));
}
