#ifndef TASK_BWD_TASK_H
#define TASK_BWD_TASK_H
#include "../data/bwd_data.hpp"
#include "../tools/gpu.hpp"
#include "../types.hpp"
#include <hedgehog/hedgehog.h>
#include <log.h/log.h>
#include <exception>
#include <stdexcept>

#define BwdTaskIn BwdData<ftype>
#define BwdTaskOut BwdData<ftype>
#define BwdTaskIO 1, BwdTaskIn, BwdTaskOut

class BwdTask : public hh::AbstractCUDATask<BwdTaskIO> {
  public:
    BwdTask() : hh::AbstractCUDATask<BwdTaskIO>("BwdTask", 1) {}

    void execute(std::shared_ptr<BwdData<ftype>> data) override {
        auto step = data->step;
        INFO_GRP("BwdTask", INFO_GRP_STEP_TASK);

        try {
            step->kernels->backward(*step->store, this->stream());
            CUDA_THROW(cudaStreamSynchronize(this->stream()));
        } catch (std::exception const &) {
            step->fault = std::current_exception();
        }
        this->addResult(data);
    }

    std::shared_ptr<hh::AbstractTask<BwdTaskIO>> copy() override {
        throw std::logic_error("error: BwdTask should not be copied.");
    }
};

#endif
