#ifndef MODEL_DATA_NETWORK_CONFIG_H
#define MODEL_DATA_NETWORK_CONFIG_H
#include "../../tools/errors.hpp"
#include "../../types.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <optional>
#include <string>

// hard limit of threads in one block on every supported architecture
constexpr int MAX_WORK_ITEMS = 1024;

struct NetworkConfig {
    int input_size = 2;
    int hidden_size = 4;
    int output_size = 1;
    ftype learning_rate = 0.01;

    bool operator==(NetworkConfig const &) const = default;
};

struct NetworkConfigUpdate {
    std::optional<int> input_size = std::nullopt;
    std::optional<int> hidden_size = std::nullopt;
    std::optional<int> output_size = std::nullopt;
    std::optional<ftype> learning_rate = std::nullopt;
};

/*
 * Both kernels run one thread per neuron of the widest layer they update, in
 * a single block (the barriers between the layers are block wide).
 */
inline int work_items(NetworkConfig const &config) {
    return std::max(config.hidden_size, config.output_size);
}

inline NetworkConfig merge_config(NetworkConfig config,
                                  NetworkConfigUpdate const &update) {
    config.input_size = update.input_size.value_or(config.input_size);
    config.hidden_size = update.hidden_size.value_or(config.hidden_size);
    config.output_size = update.output_size.value_or(config.output_size);
    config.learning_rate = update.learning_rate.value_or(config.learning_rate);
    return config;
}

inline void validate_config(NetworkConfig const &config) {
    if (config.input_size <= 0 || config.hidden_size <= 0 ||
        config.output_size <= 0) {
        throw InvalidConfig("invalid network dimensions (input_size = " +
                            std::to_string(config.input_size) +
                            ", hidden_size = " +
                            std::to_string(config.hidden_size) +
                            ", output_size = " +
                            std::to_string(config.output_size) + ").");
    }
    if (!std::isfinite(config.learning_rate) || config.learning_rate <= 0) {
        throw InvalidConfig("invalid learning rate (" +
                            std::to_string(config.learning_rate) + ").");
    }
    if (work_items(config) > MAX_WORK_ITEMS) {
        throw InvalidConfig("a layer of " +
                            std::to_string(work_items(config)) +
                            " neurons cannot be updated by a single block (max "
                            "is " +
                            std::to_string(MAX_WORK_ITEMS) + ").");
    }
}

struct network_config_hash_t {
    size_t operator()(NetworkConfig const &config) const {
        size_t seed = std::hash<int>()(config.input_size);
        auto combine = [&seed](size_t value) {
            seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        };
        combine(std::hash<int>()(config.hidden_size));
        combine(std::hash<int>()(config.output_size));
        combine(std::hash<ftype>()(config.learning_rate));
        return seed;
    }
};

#endif
