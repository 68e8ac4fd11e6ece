#ifndef SESSION_STEP_EXECUTOR_H
#define SESSION_STEP_EXECUTOR_H
#include "../graph/step_graph.hpp"
#include "../model/data/step_result.hpp"
#include <log.h/log.h>
#include <exception>
#include <memory>
#include <stdexcept>
#include <vector>

/*
 * Runs one forward + backward step on the device and reads the results back.
 * The phases are executed by the step graph, the control thread blocks until
 * the step is returned.
 */
class StepExecutor {
  public:
    StepExecutor() : graph_(std::make_shared<StepGraph>()) {
        graph_->executeGraph(true);
    }

    StepExecutor(StepExecutor const &) = delete;
    StepExecutor const &operator=(StepExecutor const &) = delete;

    ~StepExecutor() { terminate(); }

  public:
    StepResult<ftype> step(ParameterStore &store, KernelSet const &kernels,
                           std::vector<ftype> const &input,
                           std::vector<ftype> const &target) {
        if (terminated_) {
            throw std::logic_error("error: step pushed to a terminated graph.");
        }
        if (store.released()) {
            throw std::logic_error("error: step on a released parameter store.");
        }
        if (input.size() != (size_t)store.config().input_size ||
            target.size() != (size_t)store.config().output_size) {
            throw InvalidConfig(
                "the sample does not match the network dimensions.");
        }
        auto data = std::make_shared<StepData<ftype>>();

        data->store = &store;
        data->kernels = &kernels;
        data->input = input;
        data->target = target;

        graph_->pushData(data);
        auto result = graph_->get<StepData<ftype>>();

        // rethrown with its original type on the control thread
        if (result->fault) {
            std::rethrow_exception(result->fault);
        }
        return step_result_from_snapshot(std::move(result->snapshot), target);
    }

    void terminate() {
        if (terminated_)
            return;
        terminated_ = true;
        graph_->terminate();
    }

  private:
    std::shared_ptr<StepGraph> graph_ = nullptr;
    bool terminated_ = false;
};

#endif
