#ifndef GRAPH_STEP_GRAPH_H
#define GRAPH_STEP_GRAPH_H
#include "../state/step_state_manager.hpp"
#include "../task/bwd_task.hpp"
#include "../task/fwd_task.hpp"
#include "../task/readback_task.hpp"
#include <hedgehog/hedgehog.h>
#include <stdexcept>

#define StepGraphIn StepData<ftype>
#define StepGraphOut StepData<ftype>
#define StepGraphIO 1, StepGraphIn, StepGraphOut

/*
 * state -> fwd -> state -> bwd -> state -> readback -> state -> output
 *
 * The graph processes one step at a time: the state only accepts a new step
 * once the previous one has been returned.
 */
class StepGraph : public hh::Graph<StepGraphIO> {
  public:
    StepGraph()
        : hh::Graph<StepGraphIO>("StepGraph"),
          step_(std::make_shared<StepState>()),
          step_state_(std::make_shared<StepStateManager>(step_)),
          fwd_task_(std::make_shared<FwdTask>()),
          bwd_task_(std::make_shared<BwdTask>()),
          readback_task_(std::make_shared<ReadbackTask>()) {
        this->inputs(step_state_);
        this->outputs(step_state_);

        this->edges(step_state_, fwd_task_);
        this->edges(fwd_task_, step_state_);
        this->edges(step_state_, bwd_task_);
        this->edges(bwd_task_, step_state_);
        this->edges(step_state_, readback_task_);
        this->edges(readback_task_, step_state_);
    }

    void terminate() {
        // canTerminate reads the step under the state lock
        step_->lock();
        step_->terminate();
        step_->unlock();
        this->finishPushingData();
        this->waitForTermination();
    }

  public:
    template <typename OutType> std::shared_ptr<OutType> get() {
        auto result = this->getBlockingResult();

        if (result == nullptr) {
            throw std::logic_error(
                "error: no result available, the step graph is terminated.");
        }
        return std::get<std::shared_ptr<OutType>>(*result);
    }

  private:
    std::shared_ptr<StepState> step_ = nullptr;
    std::shared_ptr<StepStateManager> step_state_ = nullptr;
    std::shared_ptr<FwdTask> fwd_task_ = nullptr;
    std::shared_ptr<BwdTask> bwd_task_ = nullptr;
    std::shared_ptr<ReadbackTask> readback_task_ = nullptr;
};

#endif
