#ifndef KERNELS_KERNEL_CACHE_H
#define KERNELS_KERNEL_CACHE_H
#include "../model/data/network_config.hpp"
#include "kernel_set.hpp"
#include <log.h/log.h>
#include <string>
#include <unordered_map>

struct kernel_key_t {
    NetworkConfig config;
    int arch = 0;

    bool operator==(kernel_key_t const &) const = default;
};

struct kernel_key_hash_t {
    size_t operator()(kernel_key_t const &key) const {
        size_t seed = network_config_hash_t()(key.config);
        return seed ^ (std::hash<int>()(key.arch) + 0x9e3779b9 + (seed << 6) +
                       (seed >> 2));
    }
};

/*
 * Compiled programs by configuration. The compilation only depends on the
 * configuration and on the target architecture, so a session created again
 * for a known configuration reuses the PTX.
 */
class KernelCache {
  public:
    std::string const &ptx(NetworkConfig const &config, int arch) {
        kernel_key_t key = {.config = config, .arch = arch};
        auto it = programs_.find(key);

        if (it != programs_.end()) {
            ++hits_;
            INFO_GRP("kernel cache hit", INFO_GRP_KERNELS);
            return it->second;
        }
        ++misses_;
        return programs_.emplace(key, compile_network_kernels(config, arch))
            .first->second;
    }

    void clear() { programs_.clear(); }

    size_t size() const { return programs_.size(); }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }

  private:
    std::unordered_map<kernel_key_t, std::string, kernel_key_hash_t> programs_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

#endif
