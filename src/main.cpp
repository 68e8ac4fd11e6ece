#include "controller/training_controller.hpp"
#include "tools/frame_scheduler.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <log.h/log.h>
#include <random>

static std::chrono::microseconds frame_interval(double fps) {
    if (fps <= 0) {
        return std::chrono::microseconds(0);
    }
    return std::chrono::microseconds((int64_t)(1'000'000 / fps));
}

static void print_epoch(EpochMetrics const &record) {
    std::cout << "epoch " << std::setw(4) << record.epoch
              << " | loss: " << std::fixed << std::setprecision(6)
              << record.loss << " | accuracy: " << std::setprecision(2)
              << record.accuracy * 100 << "%" << std::endl;
}

static void print_history(std::vector<SampleHistory> const &history) {
    if (history.empty()) {
        return;
    }
    std::cout << "last " << history.size() << " samples:" << std::endl;
    for (auto const &record : history) {
        std::cout << "  [epoch " << record.epoch << "] input: [";
        for (size_t i = 0; i < record.input.size(); ++i) {
            std::cout << (i ? ", " : "") << record.input[i];
        }
        std::cout << "] target: " << record.target
                  << " prediction: " << std::fixed << std::setprecision(4)
                  << record.prediction << " loss: " << std::setprecision(6)
                  << record.loss << std::endl;
    }
}

int main(int argc, char **argv) {
    CLI::App app{"Train a small sigmoid network on the XOR truth table on the "
                 "GPU."};
    NetworkConfig config;
    size_t epochs = 10;
    double fps = 60;
    size_t history = 8;
    uint32_t seed = std::random_device()();

    app.add_option("--input-size", config.input_size, "Number of inputs")
        ->check(CLI::PositiveNumber);
    app.add_option("--hidden-size", config.hidden_size,
                   "Number of hidden neurons")
        ->check(CLI::PositiveNumber);
    app.add_option("--output-size", config.output_size, "Number of outputs")
        ->check(CLI::PositiveNumber);
    app.add_option("--lr,--learning-rate", config.learning_rate,
                   "Learning rate")
        ->check(CLI::PositiveNumber);
    app.add_option("--epochs", epochs, "Number of epochs (4 steps each)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--fps", fps, "Frames per second, 0 runs unpaced")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--history", history,
                   "Number of sample records printed at the end");
    app.add_option("--seed", seed, "Seed of the weights initialization");
    CLI11_PARSE(app, argc, argv);

    FrameScheduler scheduler(frame_interval(fps));
    TrainingController controller(scheduler, seed);

    try {
        controller.update_config({
            .input_size = config.input_size,
            .hidden_size = config.hidden_size,
            .output_size = config.output_size,
            .learning_rate = config.learning_rate,
        });
    } catch (InvalidConfig const &e) {
        ERROR(e.what());
        return 1;
    }
    controller.set_max_epochs(epochs);

    if (!controller.initialize()) {
        return 1;
    }
    if (auto info = controller.device_info()) {
        INFO(*info);
    }
    if (!controller.start_training()) {
        return 1;
    }

    // the epochs are printed as they are completed
    size_t nb_printed = 0;
    scheduler.run_until([&]() {
        auto const &records = controller.epoch_metrics();
        for (; nb_printed < records.size(); ++nb_printed) {
            print_epoch(records[nb_printed]);
        }
        return !controller.is_training();
    });
    for (; nb_printed < controller.epoch_metrics().size(); ++nb_printed) {
        print_epoch(controller.epoch_metrics()[nb_printed]);
    }

    print_history(controller.sample_history_tail(history));

    if (!controller.last_error().empty()) {
        ERROR("training stopped on error: " << controller.last_error());
        return 1;
    }
    return 0;
}
