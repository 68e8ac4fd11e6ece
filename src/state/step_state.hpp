#ifndef STATE_STEP_STATE_H
#define STATE_STEP_STATE_H
#include "../data/bwd_data.hpp"
#include "../data/fwd_data.hpp"
#include "../data/readback_data.hpp"
#include "../data/step_data.hpp"
#include "../tools/errors.hpp"
#include "../types.hpp"
#include <hedgehog/hedgehog.h>
#include <exception>
#include <log.h/log.h>

// a step entering the wrong phase is returned to the caller as a fault
#define from_step_to(data, curr, to)                                           \
    INFO_GRP("from step " #curr " to " #to ".", INFO_GRP_STEP_TASK);           \
    if (state.step != curr) {                                                  \
        ERROR("entering step " #to " from step " #curr ".");                   \
        data->fault = std::make_exception_ptr(                                 \
            DeviceFault("step graph entered " #to " out of order."));          \
        finish(data);                                                          \
        return;                                                                \
    }                                                                          \
    state.step = to;

#define StepStateIn                                                            \
    StepData<ftype>, FwdData<ftype>, BwdData<ftype>, ReadbackData<ftype>
#define StepStateOut                                                           \
    StepData<ftype>, FwdData<ftype>, BwdData<ftype>, ReadbackData<ftype>
#define StepStateIO 4, StepStateIn, StepStateOut

/*
 * Orders the phases of a step: Idle -> Fwd -> Bwd -> Readback -> Idle. A
 * fault recorded by a task short-circuits the remaining phases.
 */
class StepState : public hh::AbstractState<StepStateIO> {
  public:
    StepState() : hh::AbstractState<StepStateIO>() {}

  public:
    enum class Steps {
        Idle,
        Fwd,
        Bwd,
        Readback,
        Finish,
    };

  public:
    void execute(std::shared_ptr<StepData<ftype>> data) override {
        from_step_to(data, Steps::Idle, Steps::Fwd);
        this->addResult(std::make_shared<FwdData<ftype>>(data));
    }

    void execute(std::shared_ptr<FwdData<ftype>> data) override {
        from_step_to(data->step, Steps::Fwd, Steps::Bwd);
        if (data->step->fault) {
            finish(data->step);
            return;
        }
        this->addResult(std::make_shared<BwdData<ftype>>(data->step));
    }

    void execute(std::shared_ptr<BwdData<ftype>> data) override {
        from_step_to(data->step, Steps::Bwd, Steps::Readback);
        if (data->step->fault) {
            finish(data->step);
            return;
        }
        this->addResult(std::make_shared<ReadbackData<ftype>>(data->step));
    }

    void execute(std::shared_ptr<ReadbackData<ftype>> data) override {
        from_step_to(data->step, Steps::Readback, Steps::Idle);
        finish(data->step);
    }

  public:
    bool isDone() const { return state.step == Steps::Finish; }

    void clean() override { state.step = Steps::Idle; }

    void terminate() { state.step = Steps::Finish; }

  private:
    void finish(std::shared_ptr<StepData<ftype>> step) {
        if (state.step != Steps::Finish) {
            state.step = Steps::Idle;
        }
        this->addResult(step);
    }

  private:
    struct {
        Steps step = Steps::Idle;
    } state;
};

#endif
