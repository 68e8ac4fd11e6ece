#ifndef MODEL_DATA_PARAMETER_STORE_H
#define MODEL_DATA_PARAMETER_STORE_H
#include "device_buffer.hpp"
#include "network_config.hpp"
#include "network_weights.hpp"
#include "step_result.hpp"
#include <log.h/log.h>
#include <stdexcept>
#include <string>
#include <vector>

/*
 * Device memory of one training session: parameters, activations, gradients,
 * current sample and the loss accumulator. The buffers are sized once from the
 * network configuration and are never resized.
 */
class ParameterStore {
  public:
    struct buffers_t {
        DeviceBuffer<ftype> input;
        DeviceBuffer<ftype> target;
        DeviceBuffer<ftype> weights_hidden;
        DeviceBuffer<ftype> weights_output;
        DeviceBuffer<ftype> bias_hidden;
        DeviceBuffer<ftype> bias_output;
        DeviceBuffer<ftype> hidden_layer;
        DeviceBuffer<ftype> output_layer;
        DeviceBuffer<ftype> hidden_gradients;
        DeviceBuffer<ftype> output_gradients;
        DeviceBuffer<ftype> loss;
    };

  public:
    ParameterStore(NetworkConfig const &config,
                   NetworkWeights<ftype> const &weights)
        : config_(config) {
        if (!weights_match_config(weights, config_)) {
            throw InvalidConfig(
                "the initial weights do not match the network dimensions.");
        }
        size_t input_size = config_.input_size;
        size_t hidden_size = config_.hidden_size;
        size_t output_size = config_.output_size;

        buffers_.input = DeviceBuffer<ftype>(input_size);
        buffers_.target = DeviceBuffer<ftype>(output_size);
        buffers_.weights_hidden = DeviceBuffer<ftype>(input_size * hidden_size);
        buffers_.weights_output =
            DeviceBuffer<ftype>(hidden_size * output_size);
        buffers_.bias_hidden = DeviceBuffer<ftype>(hidden_size);
        buffers_.bias_output = DeviceBuffer<ftype>(output_size);
        buffers_.hidden_layer = DeviceBuffer<ftype>(hidden_size);
        buffers_.output_layer = DeviceBuffer<ftype>(output_size);
        buffers_.hidden_gradients = DeviceBuffer<ftype>(hidden_size);
        buffers_.output_gradients = DeviceBuffer<ftype>(output_size);
        buffers_.loss = DeviceBuffer<ftype>(1);

        // initial weights (synchronous)
        CUDA_THROW(buffers_.weights_hidden.from_host(
            weights.weights_hidden.data()));
        CUDA_THROW(buffers_.weights_output.from_host(
            weights.weights_output.data()));
        CUDA_THROW(buffers_.bias_hidden.from_host(weights.bias_hidden.data()));
        CUDA_THROW(buffers_.bias_output.from_host(weights.bias_output.data()));

        CUDA_THROW(buffers_.input.zero());
        CUDA_THROW(buffers_.target.zero());
        CUDA_THROW(buffers_.hidden_layer.zero());
        CUDA_THROW(buffers_.output_layer.zero());
        CUDA_THROW(buffers_.hidden_gradients.zero());
        CUDA_THROW(buffers_.output_gradients.zero());
        CUDA_THROW(buffers_.loss.zero());
        CUDA_THROW(cudaDeviceSynchronize());

        INFO_GRP("parameter store created (" << input_size << " -> "
                                             << hidden_size << " -> "
                                             << output_size << ")",
                 INFO_GRP_SESSION);
    }

    ParameterStore(ParameterStore const &) = delete;
    ParameterStore const &operator=(ParameterStore const &) = delete;

    ~ParameterStore() { release(); }

  public:
    void write_input(std::vector<ftype> const &input,
                     std::vector<ftype> const &target, cudaStream_t stream) {
        check_alive("write_input");
        if (input.size() != (size_t)config_.input_size ||
            target.size() != (size_t)config_.output_size) {
            throw InvalidConfig("sample of size " +
                                std::to_string(input.size()) + " -> " +
                                std::to_string(target.size()) +
                                " does not match the network dimensions.");
        }
        CUDA_THROW(buffers_.input.from_host(input.data(), stream));
        CUDA_THROW(buffers_.target.from_host(target.data(), stream));
    }

    void reset_loss(cudaStream_t stream) {
        check_alive("reset_loss");
        CUDA_THROW(buffers_.loss.zero(stream));
    }

    // blocks until the readback is complete
    store_snapshot_t<ftype> read_snapshot(cudaStream_t stream) {
        check_alive("read_snapshot");
        store_snapshot_t<ftype> snapshot = {
            .hidden_layer = std::vector<ftype>(buffers_.hidden_layer.size()),
            .output_layer = std::vector<ftype>(buffers_.output_layer.size()),
            .loss = 0,
        };

        CUDA_THROW(
            buffers_.hidden_layer.to_host(snapshot.hidden_layer.data(), stream));
        CUDA_THROW(
            buffers_.output_layer.to_host(snapshot.output_layer.data(), stream));
        CUDA_THROW(buffers_.loss.to_host(&snapshot.loss, stream));
        CUDA_THROW(cudaStreamSynchronize(stream));
        return snapshot;
    }

    NetworkWeights<ftype> read_weights() {
        check_alive("read_weights");
        NetworkWeights<ftype> weights = {
            .weights_hidden =
                std::vector<ftype>(buffers_.weights_hidden.size()),
            .weights_output =
                std::vector<ftype>(buffers_.weights_output.size()),
            .bias_hidden = std::vector<ftype>(buffers_.bias_hidden.size()),
            .bias_output = std::vector<ftype>(buffers_.bias_output.size()),
        };

        CUDA_THROW(
            buffers_.weights_hidden.to_host(weights.weights_hidden.data()));
        CUDA_THROW(
            buffers_.weights_output.to_host(weights.weights_output.data()));
        CUDA_THROW(buffers_.bias_hidden.to_host(weights.bias_hidden.data()));
        CUDA_THROW(buffers_.bias_output.to_host(weights.bias_output.data()));
        return weights;
    }

    void release() {
        if (released_)
            return;
        released_ = true;
        buffers_ = {};
        INFO_GRP("parameter store released", INFO_GRP_SESSION);
    }

  public:
    bool released() const { return released_; }
    NetworkConfig const &config() const { return config_; }
    buffers_t &buffers() { return buffers_; }

  private:
    void check_alive(char const *operation) const {
        if (released_) {
            throw std::logic_error(std::string("error: ") + operation +
                                   " called on a released parameter store.");
        }
    }

  private:
    NetworkConfig config_;
    buffers_t buffers_;
    bool released_ = false;
};

#endif
