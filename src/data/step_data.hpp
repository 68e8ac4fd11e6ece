#ifndef DATA_STEP_DATA_H
#define DATA_STEP_DATA_H
#include "../kernels/kernel_set.hpp"
#include "../model/data/parameter_store.hpp"
#include "../model/data/step_result.hpp"
#include <exception>
#include <vector>

/*
 * One training step travelling through the step graph. The store and the
 * kernels are owned by the training session that pushes the step.
 */
template <typename T> struct StepData {
    ParameterStore *store = nullptr;
    KernelSet const *kernels = nullptr;
    std::vector<T> input;
    std::vector<T> target;
    store_snapshot_t<T> snapshot;
    std::exception_ptr fault = nullptr; // set by the task that failed
};

#endif
