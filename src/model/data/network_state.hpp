#ifndef MODEL_DATA_NETWORK_STATE_H
#define MODEL_DATA_NETWORK_STATE_H
#include "network_weights.hpp"
#include <memory>
#include <vector>

/*
 * Host snapshot of the network after a step. A new snapshot is created after
 * every step, the weights are shared between the snapshots until they are
 * explicitely synchronized with the device.
 */
template <typename T> struct NetworkState {
    std::vector<T> input_layer;
    std::vector<T> hidden_layer;
    std::vector<T> output_layer;
    std::shared_ptr<NetworkWeights<T> const> weights = nullptr;
};

#endif
