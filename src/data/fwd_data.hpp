#ifndef DATA_FWD_DATA_H
#define DATA_FWD_DATA_H
#include "step_data.hpp"
#include <memory>

template <typename T> struct FwdData {
    std::shared_ptr<StepData<T>> step;
};

#endif
