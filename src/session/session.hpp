#ifndef SESSION_SESSION_H
#define SESSION_SESSION_H
#include "../device/device_session.hpp"
#include "../model/data/network_config.hpp"
#include "../model/data/network_weights.hpp"
#include "../model/data/step_result.hpp"
#include <vector>

/*
 * Resources of one training run for a fixed configuration. The training
 * controller creates a session on initialization and destroys it when the
 * configuration changes.
 */
template <typename T> class Session {
  public:
    virtual ~Session() = default;

    // one forward + backward pass on a sample, the parameters are updated
    virtual StepResult<T> step(std::vector<T> const &input,
                               std::vector<T> const &target) = 0;

    // current value of the parameters (blocking download)
    virtual NetworkWeights<T> read_weights() = 0;

    virtual NetworkConfig const &config() const = 0;
    virtual device_info_t const &device_info() const = 0;
};

#endif
