#include "orchestration.hpp"
#include "../src/controller/training_controller.hpp"
#include "../src/data/data_set.hpp"
#include "host_reference.hpp"
#include <memory>
#include <vector>

static TrainingController::session_factory_t
host_session_factory(std::shared_ptr<host_session_log_t> log) {
    return [log](NetworkConfig const &config,
                 NetworkWeights<ftype> const &weights,
                 KernelCache &) -> std::unique_ptr<Session<ftype>> {
        return std::make_unique<HostSession>(config, weights, log);
    };
}

static void run_training(FrameScheduler &scheduler,
                         TrainingController &controller) {
    scheduler.run_until([&]() { return !controller.is_training(); });
}

UTest(controller_initial_state) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    uassert(controller.status() == TrainingStatus::Uninitialized);
    uassert(controller.network_state() == nullptr);
    uassert(!controller.is_training());
    uassert(!controller.device_info().has_value());
    uassert(controller.config() == NetworkConfig{});
    uassert_equal(controller.max_epochs(), (size_t)10);
    uassert(controller.sample_history().empty());
    uassert(controller.epoch_metrics().empty());

    urequire(controller.initialize());
    uassert(controller.status() == TrainingStatus::Ready);
    uassert_equal(log->nb_sessions, (size_t)1);

    auto state = controller.network_state();
    urequire(state != nullptr);
    urequire(state->weights != nullptr);
    uassert_equal(state->input_layer.size(), (size_t)2);
    uassert_equal(state->hidden_layer.size(), (size_t)4);
    uassert_equal(state->output_layer.size(), (size_t)1);
    uassert_equal(state->weights->weights_hidden.size(), (size_t)8);
    uassert_equal(state->weights->weights_output.size(), (size_t)4);
    uassert_equal(controller.device_info()->name, std::string("host"));

    // already initialized
    uassert(controller.initialize());
    uassert_equal(log->nb_sessions, (size_t)1);
    uassert(controller.network_state() == state);
    uassert(!scheduler.has_pending());
}

UTest(controller_single_epoch) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    controller.set_max_epochs(1);
    urequire(controller.start_training());
    uassert(controller.is_training());
    run_training(scheduler, controller);

    uassert(controller.status() == TrainingStatus::Stopped);
    uassert(controller.last_error().empty());
    uassert_equal(controller.steps_done(), (size_t)4);
    urequire(controller.sample_history().size() == 4);
    urequire(controller.epoch_metrics().size() == 1);
    uassert_equal(controller.epoch_metrics()[0].epoch, (size_t)1);
    uassert_equal(controller.metrics().epoch, (size_t)1);
    uassert(!scheduler.has_pending());

    // the epoch record is the mean of the step values
    ftype loss = 0;
    for (auto const &record : controller.sample_history()) {
        loss += record.loss;
    }
    uassert_float_equal(controller.epoch_metrics()[0].loss, loss / 4, 1e-6);
    uassert_float_equal(controller.metrics().loss, loss / 4, 1e-6);
    uassert_float_equal(controller.metrics().accuracy,
                        controller.epoch_metrics()[0].accuracy, 1e-6);
}

UTest(controller_sample_cycling) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);
    std::vector<std::vector<ftype>> inputs = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};
    std::vector<ftype> targets = {0, 1, 1, 0};

    controller.set_max_epochs(3);
    urequire(controller.start_training());
    run_training(scheduler, controller);

    urequire(log->inputs.size() == 12);
    urequire(controller.sample_history().size() == 12);
    for (size_t i = 0; i < 12; ++i) {
        auto const &record = controller.sample_history()[i];
        uassert(log->inputs[i] == inputs[i % 4]);
        uassert(record.input == inputs[i % 4]);
        uassert_equal(record.target, targets[i % 4]);
    }
}

UTest(controller_epoch_boundaries) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    controller.set_max_epochs(5);
    urequire(controller.start_training());

    for (size_t frame = 1; frame <= 20; ++frame) {
        uassert(controller.is_training());
        scheduler.run_frame();
        uassert_equal(controller.steps_done(), frame);
        uassert_equal(controller.epoch_metrics().size(), frame / 4);
        uassert_equal(controller.sample_history().back().epoch, frame / 4);
        uassert_equal(controller.metrics().epoch, frame / 4);

        if (frame % 4 != 0) {
            // step values
            ftype accuracy = controller.metrics().accuracy;
            uassert(accuracy == 0 || accuracy == 1);
            uassert_float_equal(controller.metrics().loss,
                                controller.sample_history().back().loss, 1e-7);
        }
    }
    uassert(!controller.is_training());

    for (size_t i = 0; i < controller.epoch_metrics().size(); ++i) {
        auto const &record = controller.epoch_metrics()[i];
        uassert_equal(record.epoch, i + 1);
        uassert(record.accuracy >= 0 && record.accuracy <= 1);
    }
}

UTest(controller_halts_at_max_epochs) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    controller.set_max_epochs(2);
    urequire(controller.start_training());
    run_training(scheduler, controller);

    uassert_equal(controller.steps_done(), (size_t)8);
    uassert_equal(controller.completed_epochs(), (size_t)2);
    uassert_equal(log->inputs.size(), (size_t)8);

    // nothing runs past the last epoch
    uassert_equal(scheduler.run_frame(), (size_t)0);
    uassert_equal(log->inputs.size(), (size_t)8);
    uassert_equal(controller.sample_history().size(), (size_t)8);
    uassert_equal(controller.epoch_metrics().size(), (size_t)2);
}

UTest(controller_zero_epochs) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    controller.set_max_epochs(0);
    urequire(controller.start_training());
    uassert(controller.is_training());
    scheduler.run_frame();

    uassert(controller.status() == TrainingStatus::Stopped);
    uassert_equal(controller.steps_done(), (size_t)0);
    uassert(log->inputs.empty());
    uassert(controller.sample_history().empty());
    uassert(!scheduler.has_pending());
}

UTest(controller_stop_training) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    // nothing to stop
    controller.stop_training();
    uassert(controller.status() == TrainingStatus::Uninitialized);

    urequire(controller.start_training());
    scheduler.run_frame();
    scheduler.run_frame();
    scheduler.run_frame();
    uassert(scheduler.has_pending());

    controller.stop_training();
    controller.stop_training();

    uassert(controller.status() == TrainingStatus::Stopped);
    uassert(!controller.is_training());
    uassert(controller.last_error().empty());
    uassert(!scheduler.has_pending());
    uassert_equal(scheduler.run_frame(), (size_t)0);
    uassert_equal(controller.sample_history().size(), (size_t)3);
    uassert_equal(log->inputs.size(), (size_t)3);
    uassert(controller.network_state() != nullptr);
}

UTest(controller_start_while_training) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    urequire(controller.start_training());
    scheduler.run_frame();
    uassert(controller.start_training());

    // the loop is not scheduled twice and the counters are kept
    uassert_equal(scheduler.run_frame(), (size_t)1);
    uassert_equal(controller.steps_done(), (size_t)2);
    uassert_equal(log->nb_sessions, (size_t)1);
    controller.stop_training();
}

UTest(controller_restart) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    controller.set_max_epochs(1);
    urequire(controller.start_training());
    run_training(scheduler, controller);
    auto state = controller.network_state();

    // the session and the records are kept, the counters restart
    urequire(controller.start_training());
    uassert_equal(controller.steps_done(), (size_t)0);
    uassert_float_equal(controller.metrics().loss, 0.f, 1e-9);
    run_training(scheduler, controller);

    uassert_equal(log->nb_sessions, (size_t)1);
    uassert_equal(log->inputs.size(), (size_t)8);
    uassert_equal(controller.sample_history().size(), (size_t)8);
    urequire(controller.epoch_metrics().size() == 2);
    uassert_equal(controller.epoch_metrics()[0].epoch, (size_t)1);
    uassert_equal(controller.epoch_metrics()[1].epoch, (size_t)1);
    uassert(controller.network_state() != state);
    uassert(controller.network_state()->weights == state->weights);
}

UTest(controller_update_config) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    controller.set_max_epochs(1);
    urequire(controller.start_training());
    run_training(scheduler, controller);
    auto old_state = controller.network_state();

    controller.update_config({.hidden_size = 8});
    uassert(controller.status() == TrainingStatus::Uninitialized);
    uassert(controller.network_state() == nullptr);
    uassert(controller.sample_history().empty());
    uassert(controller.epoch_metrics().empty());
    uassert_float_equal(controller.metrics().loss, 0.f, 1e-9);
    uassert_equal(controller.config().hidden_size, 8);
    uassert_equal(controller.config().input_size, 2);
    uassert_equal(controller.max_epochs(), (size_t)1);

    urequire(controller.start_training());
    auto state = controller.network_state();
    urequire(state != nullptr);
    uassert(state != old_state);
    uassert_equal(state->weights->weights_hidden.size(), (size_t)16);
    uassert_equal(state->weights->weights_output.size(), (size_t)8);
    uassert_equal(state->weights->bias_hidden.size(), (size_t)8);
    uassert_equal(log->nb_sessions, (size_t)2);
    run_training(scheduler, controller);
    uassert_equal(controller.network_state()->hidden_layer.size(), (size_t)8);

    // update during the training
    urequire(controller.start_training());
    scheduler.run_frame();
    scheduler.run_frame();
    controller.update_config({.learning_rate = 0.5});
    uassert(!controller.is_training());
    uassert(controller.status() == TrainingStatus::Uninitialized);
    uassert(!scheduler.has_pending());
    uassert(controller.sample_history().empty());
    uassert_float_equal(controller.config().learning_rate, 0.5f, 1e-7);
}

UTest(controller_invalid_update) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);
    bool rejected = false;

    urequire(controller.initialize());
    auto state = controller.network_state();

    try {
        controller.update_config({.hidden_size = 0});
    } catch (InvalidConfig const &) {
        rejected = true;
    }
    uassert(rejected);
    uassert(controller.config() == NetworkConfig{});
    uassert(controller.status() == TrainingStatus::Ready);
    uassert(controller.network_state() == state);
}

UTest(controller_init_failure) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    log->fail_init = true;
    uassert(!controller.start_training());
    uassert(controller.status() == TrainingStatus::Uninitialized);
    uassert(!controller.is_training());
    uassert(!controller.last_error().empty());
    uassert(controller.network_state() == nullptr);
    uassert(!scheduler.has_pending());

    log->fail_init = false;
    urequire(controller.start_training());
    uassert(controller.last_error().empty());
    uassert(controller.is_training());
    controller.stop_training();
}

UTest(controller_device_fault) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 7);

    log->fault_at_step = 2;
    controller.set_max_epochs(5);
    urequire(controller.start_training());
    run_training(scheduler, controller);

    // the failed step has no effect
    uassert(controller.status() == TrainingStatus::Stopped);
    uassert(!controller.last_error().empty());
    uassert_equal(controller.steps_done(), (size_t)2);
    uassert_equal(controller.sample_history().size(), (size_t)2);
    uassert(controller.network_state() == nullptr);
    uassert(!scheduler.has_pending());

    // no automatic retry, a new start creates a new session
    uassert_equal(log->nb_sessions, (size_t)1);
    log->fault_at_step = std::nullopt;
    urequire(controller.start_training());
    uassert_equal(log->nb_sessions, (size_t)2);
    run_training(scheduler, controller);
    uassert_equal(controller.steps_done(), (size_t)20);
}

UTest(controller_weights_sync) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 11);
    NetworkConfig config;

    controller.set_max_epochs(1);
    urequire(controller.initialize());
    auto initial = controller.network_state()->weights;
    urequire(controller.start_training());
    run_training(scheduler, controller);

    // the snapshot weights are not updated by the steps
    auto state = controller.network_state();
    uassert(state->weights == initial);

    // same steps on the host
    auto expected = create_network_weights<ftype>(config, 11);
    auto data_set = create_xor_data_set<ftype>(config);
    for (size_t step = 0; step < 4; ++step) {
        auto const &sample = sample_at(data_set, step);
        auto activations = host_forward(config, expected, sample.input);
        host_backward(config, expected, sample.input, sample.ground_truth,
                      activations);
    }
    uassert(initial->weights_hidden ==
            create_network_weights<ftype>(config, 11).weights_hidden);

    controller.sync_weights();
    auto synced = controller.network_state();
    urequire(synced->weights != initial);
    uassert(synced->output_layer == state->output_layer);
    for (size_t i = 0; i < expected.weights_hidden.size(); ++i) {
        uassert_float_equal(synced->weights->weights_hidden[i],
                            expected.weights_hidden[i], 1e-6);
    }
    for (size_t i = 0; i < expected.weights_output.size(); ++i) {
        uassert_float_equal(synced->weights->weights_output[i],
                            expected.weights_output[i], 1e-6);
    }
    for (size_t i = 0; i < expected.bias_output.size(); ++i) {
        uassert_float_equal(synced->weights->bias_output[i],
                            expected.bias_output[i], 1e-6);
    }
    uassert(synced->weights->weights_output != initial->weights_output);
}

UTest(controller_weights_sync_fault) {
    FrameScheduler scheduler;
    auto log = std::make_shared<host_session_log_t>();
    TrainingController controller(scheduler, host_session_factory(log), 13);

    urequire(controller.initialize());
    uassert(controller.status() == TrainingStatus::Ready);

    log->fail_read_weights = true;
    controller.sync_weights();
    uassert(controller.status() == TrainingStatus::Stopped);
    uassert(!controller.last_error().empty());
    uassert(controller.network_state() == nullptr);
    uassert(!controller.device_info());
    uassert(!controller.is_training());

    // the next start creates a new session
    log->fail_read_weights = false;
    controller.set_max_epochs(1);
    urequire(controller.start_training());
    uassert_equal(log->nb_sessions, (size_t)2);
    run_training(scheduler, controller);
    uassert(controller.status() == TrainingStatus::Stopped);
    uassert_equal(controller.steps_done(), (size_t)4);
    uassert(controller.last_error().empty());
}
