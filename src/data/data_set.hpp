#ifndef DATA_DATA_SET_H
#define DATA_DATA_SET_H
#include "../model/data/network_config.hpp"
#include <utility>
#include <vector>

template <typename T> struct Data {
    std::vector<T> input;
    std::vector<T> ground_truth;
};

template <typename T> struct DataSet {
    std::vector<Data<T>> datas;
};

/*
 * XOR truth table: [0,0] -> 0, [0,1] -> 1, [1,0] -> 1, [1,1] -> 0.
 *
 * The samples are sized for the network: the extra inputs and outputs are
 * zero (a network with a single input only sees the first bit).
 */
template <typename T>
DataSet<T> create_xor_data_set(NetworkConfig const &config) {
    constexpr T table[4][3] = {
        {0, 0, 0},
        {0, 1, 1},
        {1, 0, 1},
        {1, 1, 0},
    };
    DataSet<T> data_set;

    for (auto const &row : table) {
        Data<T> data = {
            .input = std::vector<T>((size_t)config.input_size, 0),
            .ground_truth = std::vector<T>((size_t)config.output_size, 0),
        };

        for (size_t i = 0; i < 2 && i < data.input.size(); ++i) {
            data.input[i] = row[i];
        }
        data.ground_truth[0] = row[2];
        data_set.datas.push_back(std::move(data));
    }
    return data_set;
}

// the samples are cycled in order
template <typename T>
Data<T> const &sample_at(DataSet<T> const &data_set, size_t step) {
    return data_set.datas[step % data_set.datas.size()];
}

#endif
