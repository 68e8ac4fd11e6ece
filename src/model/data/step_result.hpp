#ifndef MODEL_DATA_STEP_RESULT_H
#define MODEL_DATA_STEP_RESULT_H
#include <cmath>
#include <utility>
#include <vector>

// values read back from the device after a step
template <typename T> struct store_snapshot_t {
    std::vector<T> hidden_layer;
    std::vector<T> output_layer;
    T loss = 0; // sum of the squared errors
};

template <typename T> struct StepResult {
    T loss = 0;     // mean squared error
    T accuracy = 0; // 0 or 1
    std::vector<T> output_layer;
    std::vector<T> hidden_layer;
};

template <typename T>
StepResult<T> step_result_from_snapshot(store_snapshot_t<T> &&snapshot,
                                        std::vector<T> const &target) {
    StepResult<T> result;
    // the prediction is rounded with a 0.5 threshold
    T rounded = snapshot.output_layer[0] >= 0.5 ? 1 : 0;

    result.loss = snapshot.loss / (T)snapshot.output_layer.size();
    result.accuracy = rounded == std::round(target[0]) ? 1 : 0;
    result.output_layer = std::move(snapshot.output_layer);
    result.hidden_layer = std::move(snapshot.hidden_layer);
    return result;
}

#endif
