#ifndef TASK_FWD_TASK_H
#define TASK_FWD_TASK_H
#include "../data/fwd_data.hpp"
#include "../tools/gpu.hpp"
#include "../types.hpp"
#include <hedgehog/hedgehog.h>
#include <log.h/log.h>
#include <exception>
#include <stdexcept>

#define FwdTaskIn FwdData<ftype>
#define FwdTaskOut FwdData<ftype>
#define FwdTaskIO 1, FwdTaskIn, FwdTaskOut

/*
 * Resets the loss accumulator, uploads the sample and runs the forward
 * kernel.
 */
class FwdTask : public hh::AbstractCUDATask<FwdTaskIO> {
  public:
    FwdTask() : hh::AbstractCUDATask<FwdTaskIO>("FwdTask", 1) {}

    void execute(std::shared_ptr<FwdData<ftype>> data) override {
        auto step = data->step;
        INFO_GRP("FwdTask", INFO_GRP_STEP_TASK);

        try {
            step->store->reset_loss(this->stream());
            step->store->write_input(step->input, step->target,
                                     this->stream());
            CUDA_THROW(cudaStreamSynchronize(this->stream()));
            step->kernels->forward(*step->store, this->stream());
            CUDA_THROW(cudaStreamSynchronize(this->stream()));
        } catch (std::exception const &) {
            step->fault = std::current_exception();
        }
        this->addResult(data);
    }

    std::shared_ptr<hh::AbstractTask<FwdTaskIO>> copy() override {
        throw std::logic_error("error: FwdTask should not be copied.");
    }
};

#endif
