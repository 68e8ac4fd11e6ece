#ifndef TASK_READBACK_TASK_H
#define TASK_READBACK_TASK_H
#include "../data/readback_data.hpp"
#include "../tools/gpu.hpp"
#include "../types.hpp"
#include <hedgehog/hedgehog.h>
#include <log.h/log.h>
#include <exception>
#include <stdexcept>

#define ReadbackTaskIn ReadbackData<ftype>
#define ReadbackTaskOut ReadbackData<ftype>
#define ReadbackTaskIO 1, ReadbackTaskIn, ReadbackTaskOut

// downloads the activations and the loss accumulator after the update
class ReadbackTask : public hh::AbstractCUDATask<ReadbackTaskIO> {
  public:
    ReadbackTask() : hh::AbstractCUDATask<ReadbackTaskIO>("ReadbackTask", 1) {}

    void execute(std::shared_ptr<ReadbackData<ftype>> data) override {
        auto step = data->step;
        INFO_GRP("ReadbackTask", INFO_GRP_STEP_TASK);

        try {
            step->snapshot = step->store->read_snapshot(this->stream());
        } catch (std::exception const &) {
            step->fault = std::current_exception();
        }
        this->addResult(data);
    }

    std::shared_ptr<hh::AbstractTask<ReadbackTaskIO>> copy() override {
        throw std::logic_error("error: ReadbackTask should not be copied.");
    }
};

#endif
