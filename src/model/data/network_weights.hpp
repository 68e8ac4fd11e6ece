#ifndef MODEL_DATA_NETWORK_WEIGHTS_H
#define MODEL_DATA_NETWORK_WEIGHTS_H
#include "network_config.hpp"
#include <cstdint>
#include <random>
#include <vector>

/*
 * Row major: the weight from the source neuron i to the destination neuron j
 * is stored at i * destination_size + j.
 */
template <typename T> struct NetworkWeights {
    std::vector<T> weights_hidden; // input_size x hidden_size
    std::vector<T> weights_output; // hidden_size x output_size
    std::vector<T> bias_hidden;
    std::vector<T> bias_output;
};

template <typename T>
void fill_random_uniform(std::vector<T> &values, T lower_bound,
                         T higher_bound, std::mt19937 &mt) {
    std::uniform_real_distribution<T> dist(lower_bound, higher_bound);

    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = dist(mt);
    }
}

template <typename T>
NetworkWeights<T> create_network_weights(NetworkConfig const &config,
                                         uint32_t seed = 0) {
    NetworkWeights<T> weights = {
        .weights_hidden = std::vector<T>(
            (size_t)config.input_size * (size_t)config.hidden_size),
        .weights_output = std::vector<T>(
            (size_t)config.hidden_size * (size_t)config.output_size),
        .bias_hidden = std::vector<T>((size_t)config.hidden_size),
        .bias_output = std::vector<T>((size_t)config.output_size),
    };
    std::mt19937 mt(seed);

    fill_random_uniform<T>(weights.weights_hidden, -1, 1, mt);
    fill_random_uniform<T>(weights.weights_output, -1, 1, mt);
    fill_random_uniform<T>(weights.bias_hidden, -1, 1, mt);
    fill_random_uniform<T>(weights.bias_output, -1, 1, mt);
    return weights;
}

template <typename T>
bool weights_match_config(NetworkWeights<T> const &weights,
                          NetworkConfig const &config) {
    return weights.weights_hidden.size() ==
               (size_t)config.input_size * (size_t)config.hidden_size &&
           weights.weights_output.size() ==
               (size_t)config.hidden_size * (size_t)config.output_size &&
           weights.bias_hidden.size() == (size_t)config.hidden_size &&
           weights.bias_output.size() == (size_t)config.output_size;
}

#endif
