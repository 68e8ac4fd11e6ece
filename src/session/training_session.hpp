#ifndef SESSION_TRAINING_SESSION_H
#define SESSION_TRAINING_SESSION_H
#include "../device/device_session.hpp"
#include "../kernels/kernel_cache.hpp"
#include "../kernels/kernel_set.hpp"
#include "../model/data/parameter_store.hpp"
#include "session.hpp"
#include "step_executor.hpp"
#include <memory>

/*
 * Device session, parameter store, kernels and step graph of one
 * configuration. The resources are created in this order and released in
 * the reverse order.
 */
class TrainingSession : public Session<ftype> {
  public:
    TrainingSession(NetworkConfig const &config,
                    NetworkWeights<ftype> const &weights, KernelCache &cache,
                    int device_id = 0);

    TrainingSession(TrainingSession const &) = delete;
    TrainingSession const &operator=(TrainingSession const &) = delete;

    ~TrainingSession();

  public:
    StepResult<ftype> step(std::vector<ftype> const &input,
                           std::vector<ftype> const &target) override;
    NetworkWeights<ftype> read_weights() override;

    NetworkConfig const &config() const override { return config_; }
    device_info_t const &device_info() const override {
        return device_->info();
    }

    ParameterStore &store() { return *store_; }
    KernelSet const &kernels() const { return *kernels_; }

  private:
    NetworkConfig config_;
    std::unique_ptr<DeviceSession> device_ = nullptr;
    std::unique_ptr<ParameterStore> store_ = nullptr;
    std::unique_ptr<KernelSet> kernels_ = nullptr;
    std::unique_ptr<StepExecutor> executor_ = nullptr;
};

#endif
