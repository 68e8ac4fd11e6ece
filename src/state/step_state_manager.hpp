#ifndef STATE_STEP_STATE_MANAGER_H
#define STATE_STEP_STATE_MANAGER_H
#include "step_state.hpp"
#include <hedgehog/hedgehog.h>

class StepStateManager : public hh::StateManager<StepStateIO> {
  public:
    StepStateManager(std::shared_ptr<StepState> const &state)
        : hh::StateManager<StepStateIO>(state, "StepState") {}

    [[nodiscard]] bool canTerminate() const override {
        this->state()->lock();
        auto ret =
            std::dynamic_pointer_cast<StepState>(this->state())->isDone();
        this->state()->unlock();
        return ret;
    }
};

#endif
