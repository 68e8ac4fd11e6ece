#ifndef MODEL_DATA_TRAINING_METRICS_H
#define MODEL_DATA_TRAINING_METRICS_H
#include "../../types.hpp"
#include <cstddef>
#include <vector>

struct TrainingMetrics {
    ftype loss = 0;
    size_t epoch = 0;
    ftype accuracy = 0;
};

// one record per step
struct SampleHistory {
    size_t epoch = 0;
    std::vector<ftype> input;
    ftype target = 0;
    ftype prediction = 0;
    ftype loss = 0;
};

// one record per completed epoch (means over the epoch steps)
struct EpochMetrics {
    size_t epoch = 0;
    ftype loss = 0;
    ftype accuracy = 0;
};

#endif
