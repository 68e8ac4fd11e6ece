#ifndef DATA_BWD_DATA_H
#define DATA_BWD_DATA_H
#include "step_data.hpp"
#include <memory>

template <typename T> struct BwdData {
    std::shared_ptr<StepData<T>> step;
};

#endif
