#ifndef CONTROLLER_TRAINING_CONTROLLER_H
#define CONTROLLER_TRAINING_CONTROLLER_H
#include "../data/data_set.hpp"
#include "../kernels/kernel_cache.hpp"
#include "../model/data/network_config.hpp"
#include "../model/data/network_state.hpp"
#include "../model/data/training_metrics.hpp"
#include "../session/session.hpp"
#include "../tools/frame_scheduler.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class TrainingStatus {
    Uninitialized,
    Initializing,
    Ready,
    Training,
    Stopped,
};

char const *to_string(TrainingStatus status);

/*
 * Drives the training of the network on the XOR truth table. One step runs per
 * frame of the scheduler, every 4 steps close an epoch and the loop stops by
 * itself after `max_epochs` epochs.
 *
 * All the methods must be called from the thread that runs the scheduler.
 */
class TrainingController {
  public:
    using session_factory_t = std::function<std::unique_ptr<Session<ftype>>(
        NetworkConfig const &, NetworkWeights<ftype> const &, KernelCache &)>;

  public:
    TrainingController(FrameScheduler &scheduler, uint32_t seed = 0);
    TrainingController(FrameScheduler &scheduler,
                       session_factory_t session_factory, uint32_t seed = 0);

    TrainingController(TrainingController const &) = delete;
    TrainingController const &operator=(TrainingController const &) = delete;

    ~TrainingController();

  public:
    /*
     * Creates the session (device, buffers, kernels) and the initial network
     * state. Does nothing when the controller is already initialized. Returns
     * false when the initialization failed (see `last_error()`).
     */
    bool initialize();

    /*
     * Resets the counters and the metrics and schedules the training loop.
     * The controller is initialized first if needed. Returns false when the
     * training could not be started.
     */
    bool start_training();

    // idempotent, the running step (if any) is never interrupted
    void stop_training();

    /*
     * Stops the training, releases the session and clears the records. The
     * update is rejected with an InvalidConfig before any change when the
     * resulting configuration is invalid.
     */
    void update_config(NetworkConfigUpdate const &update);

    // downloads the device weights and installs them in the network state
    void sync_weights();

  public:
    NetworkConfig const &config() const { return config_; }
    std::shared_ptr<NetworkState<ftype> const> network_state() const {
        return network_state_;
    }
    TrainingMetrics const &metrics() const { return metrics_; }
    std::vector<SampleHistory> const &sample_history() const {
        return sample_history_;
    }
    std::vector<SampleHistory> sample_history_tail(size_t n) const;
    std::vector<EpochMetrics> const &epoch_metrics() const {
        return epoch_metrics_;
    }

    bool is_training() const { return status_ == TrainingStatus::Training; }
    TrainingStatus status() const { return status_; }
    std::string const &last_error() const { return last_error_; }
    std::optional<device_info_t> device_info() const;

    size_t max_epochs() const { return max_epochs_; }
    void set_max_epochs(size_t max_epochs) { max_epochs_ = max_epochs; }

    size_t steps_done() const { return steps_done_; }
    size_t completed_epochs() const { return completed_epochs_; }
    KernelCache const &kernel_cache() const { return kernel_cache_; }

  private:
    void schedule();
    void training_loop();
    void run_step();
    void close_epoch();
    void release_session();

  private:
    FrameScheduler &scheduler_;
    session_factory_t session_factory_;
    uint32_t seed_ = 0;
    KernelCache kernel_cache_;

    NetworkConfig config_;
    size_t max_epochs_ = 10;
    TrainingStatus status_ = TrainingStatus::Uninitialized;
    std::string last_error_ = "";

    std::unique_ptr<Session<ftype>> session_ = nullptr;
    DataSet<ftype> data_set_;
    std::shared_ptr<NetworkState<ftype> const> network_state_ = nullptr;

    // training loop
    std::optional<FrameScheduler::frame_id_t> frame_id_ = std::nullopt;
    bool stop_requested_ = false;
    size_t steps_done_ = 0;
    size_t completed_epochs_ = 0;

    // records
    TrainingMetrics metrics_;
    std::vector<SampleHistory> sample_history_ = {};
    std::vector<EpochMetrics> epoch_metrics_ = {};
    struct {
        ftype loss = 0;
        ftype accuracy = 0;
        size_t nb_samples = 0;
    } epoch_accumulator_;
};

#endif
