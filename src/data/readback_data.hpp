#ifndef DATA_READBACK_DATA_H
#define DATA_READBACK_DATA_H
#include "step_data.hpp"
#include <memory>

template <typename T> struct ReadbackData {
    std::shared_ptr<StepData<T>> step;
};

#endif
