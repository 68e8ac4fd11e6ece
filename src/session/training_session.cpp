#include "training_session.hpp"
#include <log.h/log.h>

TrainingSession::TrainingSession(NetworkConfig const &config,
                                 NetworkWeights<ftype> const &weights,
                                 KernelCache &cache, int device_id)
    : config_(config) {
    validate_config(config_);
    device_ = DeviceSession::acquire(device_id);

    auto const &info = device_->info();
    if (work_items(config_) > info.max_threads_per_block) {
        throw InvalidConfig("a layer of " +
                            std::to_string(work_items(config_)) +
                            " neurons exceeds the " +
                            std::to_string(info.max_threads_per_block) +
                            " threads per block of " + info.name + ".");
    }

    store_ = std::make_unique<ParameterStore>(config_, weights);
    device_->make_current();
    kernels_ = std::make_unique<KernelSet>(
        config_, cache.ptx(config_, compute_arch(info)));
    executor_ = std::make_unique<StepExecutor>();
    INFO_GRP("training session ready", INFO_GRP_SESSION);
}

TrainingSession::~TrainingSession() {
    executor_ = nullptr;
    kernels_ = nullptr;
    store_->release();
    store_ = nullptr;
    device_ = nullptr;
    INFO_GRP("training session closed", INFO_GRP_SESSION);
}

StepResult<ftype> TrainingSession::step(std::vector<ftype> const &input,
                                        std::vector<ftype> const &target) {
    return executor_->step(*store_, *kernels_, input, target);
}

NetworkWeights<ftype> TrainingSession::read_weights() {
    device_->make_current();
    return store_->read_weights();
}
