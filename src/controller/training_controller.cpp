#include "training_controller.hpp"
#include "../session/training_session.hpp"
#include <algorithm>
#include <log.h/log.h>

// number of samples of the XOR truth table
constexpr size_t EPOCH_SIZE = 4;

char const *to_string(TrainingStatus status) {
    switch (status) {
    case TrainingStatus::Uninitialized:
        return "uninitialized";
    case TrainingStatus::Initializing:
        return "initializing";
    case TrainingStatus::Ready:
        return "ready";
    case TrainingStatus::Training:
        return "training";
    case TrainingStatus::Stopped:
        return "stopped";
    }
    return "unknown";
}

static std::unique_ptr<Session<ftype>>
create_training_session(NetworkConfig const &config,
                        NetworkWeights<ftype> const &weights,
                        KernelCache &cache) {
    return std::make_unique<TrainingSession>(config, weights, cache);
}

TrainingController::TrainingController(FrameScheduler &scheduler,
                                       uint32_t seed)
    : TrainingController(scheduler, create_training_session, seed) {}

TrainingController::TrainingController(FrameScheduler &scheduler,
                                       session_factory_t session_factory,
                                       uint32_t seed)
    : scheduler_(scheduler), session_factory_(std::move(session_factory)),
      seed_(seed) {}

TrainingController::~TrainingController() {
    stop_training();
    release_session();
}

/******************************************************************************/
/*                                 lifecycle                                  */
/******************************************************************************/

bool TrainingController::initialize() {
    if (network_state_) {
        return true;
    }
    status_ = TrainingStatus::Initializing;
    INFO_GRP("initializing the training session", INFO_GRP_SESSION);

    try {
        auto weights = std::make_shared<NetworkWeights<ftype>>(
            create_network_weights<ftype>(config_, seed_++));
        auto state = std::make_shared<NetworkState<ftype>>();

        session_ = session_factory_(config_, *weights, kernel_cache_);
        data_set_ = create_xor_data_set<ftype>(config_);
        state->input_layer = std::vector<ftype>((size_t)config_.input_size, 0);
        state->hidden_layer = std::vector<ftype>((size_t)config_.hidden_size, 0);
        state->output_layer = std::vector<ftype>((size_t)config_.output_size, 0);
        state->weights = weights;
        network_state_ = state;
    } catch (training_error const &e) {
        ERROR("initialization failed: " << e.what());
        last_error_ = e.what();
        release_session();
        status_ = TrainingStatus::Uninitialized;
        return false;
    }
    last_error_ = "";
    status_ = TrainingStatus::Ready;
    return true;
}

bool TrainingController::start_training() {
    if (status_ == TrainingStatus::Training) {
        return true;
    }
    if (!initialize()) {
        return false;
    }
    steps_done_ = 0;
    completed_epochs_ = 0;
    metrics_ = {};
    epoch_accumulator_ = {};
    stop_requested_ = false;
    status_ = TrainingStatus::Training;
    INFO("start training (learning_rate = " << config_.learning_rate
                                            << ", max_epochs = " << max_epochs_
                                            << ")");
    schedule();
    return true;
}

void TrainingController::stop_training() {
    stop_requested_ = true;
    if (frame_id_) {
        scheduler_.cancel_frame(*frame_id_);
        frame_id_ = std::nullopt;
    }
    if (status_ == TrainingStatus::Training) {
        status_ = TrainingStatus::Stopped;
        INFO("training stopped after " << steps_done_ << " steps ("
                                       << completed_epochs_ << " epochs)");
    }
}

void TrainingController::update_config(NetworkConfigUpdate const &update) {
    NetworkConfig config = merge_config(config_, update);

    validate_config(config);
    stop_training();
    release_session();
    config_ = config;
    metrics_ = {};
    sample_history_.clear();
    epoch_metrics_.clear();
    status_ = TrainingStatus::Uninitialized;
    INFO_GRP("new configuration (" << config_.input_size << ", "
                                   << config_.hidden_size << ", "
                                   << config_.output_size << ", "
                                   << config_.learning_rate << ")",
             INFO_GRP_SESSION);
}

void TrainingController::sync_weights() {
    if (!session_ || !network_state_) {
        return;
    }
    try {
        auto state = std::make_shared<NetworkState<ftype>>(*network_state_);

        state->weights = std::make_shared<NetworkWeights<ftype>>(
            session_->read_weights());
        network_state_ = state;
    } catch (training_error const &e) {
        ERROR("weights synchronization failed: " << e.what());
        last_error_ = e.what();
        stop_training();
        release_session();
        status_ = TrainingStatus::Stopped;
    }
}

void TrainingController::release_session() {
    session_ = nullptr;
    network_state_ = nullptr;
}

/******************************************************************************/
/*                               training loop                                */
/******************************************************************************/

void TrainingController::schedule() {
    frame_id_ = scheduler_.request_frame([this]() { training_loop(); });
}

void TrainingController::training_loop() {
    frame_id_ = std::nullopt;

    if (stop_requested_ || status_ != TrainingStatus::Training) {
        return;
    }
    if (completed_epochs_ >= max_epochs_) {
        stop_training();
        return;
    }

    try {
        run_step();
    } catch (training_error const &e) {
        ERROR("training step failed: " << e.what());
        last_error_ = e.what();
        stop_training();
        release_session();
        return;
    }

    if (completed_epochs_ >= max_epochs_) {
        INFO("training complete (" << completed_epochs_ << " epochs)");
        stop_training();
        return;
    }
    if (!stop_requested_) {
        schedule();
    }
}

void TrainingController::run_step() {
    auto const &sample = sample_at(data_set_, steps_done_);
    StepResult<ftype> result = session_->step(sample.input, sample.ground_truth);
    auto state = std::make_shared<NetworkState<ftype>>();

    ++steps_done_;

    state->input_layer = sample.input;
    state->hidden_layer = result.hidden_layer;
    state->output_layer = result.output_layer;
    state->weights = network_state_->weights;
    network_state_ = state;

    size_t epoch = steps_done_ / EPOCH_SIZE;
    metrics_ = {
        .loss = result.loss,
        .epoch = epoch,
        .accuracy = result.accuracy,
    };
    sample_history_.push_back({
        .epoch = epoch,
        .input = sample.input,
        .target = sample.ground_truth[0],
        .prediction = result.output_layer[0],
        .loss = result.loss,
    });
    INFO_GRP("step " << steps_done_ << ": loss = " << result.loss
                     << ", prediction = " << result.output_layer[0],
             INFO_GRP_TRAINING);

    epoch_accumulator_.loss += result.loss;
    epoch_accumulator_.accuracy += result.accuracy;
    ++epoch_accumulator_.nb_samples;

    if (steps_done_ % EPOCH_SIZE == 0) {
        close_epoch();
    }
}

void TrainingController::close_epoch() {
    ++completed_epochs_;
    EpochMetrics record = {
        .epoch = completed_epochs_,
        .loss = epoch_accumulator_.loss / (ftype)epoch_accumulator_.nb_samples,
        .accuracy = epoch_accumulator_.accuracy /
                    (ftype)epoch_accumulator_.nb_samples,
    };

    epoch_metrics_.push_back(record);
    metrics_ = {
        .loss = record.loss,
        .epoch = record.epoch,
        .accuracy = record.accuracy,
    };
    epoch_accumulator_ = {};
    INFO_GRP("epoch " << record.epoch << ": loss = " << record.loss
                      << ", accuracy = " << record.accuracy,
             INFO_GRP_TRAINING);
}

/******************************************************************************/
/*                                  records                                   */
/******************************************************************************/

std::vector<SampleHistory>
TrainingController::sample_history_tail(size_t n) const {
    size_t count = std::min(n, sample_history_.size());
    return std::vector<SampleHistory>(sample_history_.end() - count,
                                      sample_history_.end());
}

std::optional<device_info_t> TrainingController::device_info() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->device_info();
}
