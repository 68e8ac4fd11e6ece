#ifndef TOOLS_ERRORS_H
#define TOOLS_ERRORS_H
#include <stdexcept>
#include <string>

/******************************************************************************/
/*                                 exceptions                                 */
/******************************************************************************/

struct training_error : std::runtime_error {
    training_error(std::string const &msg) : std::runtime_error(msg) {}
};

// no CUDA driver or no CUDA capable device on the host
struct UnsupportedBackend : training_error {
    UnsupportedBackend(std::string const &msg) : training_error(msg) {}
};

// a device exists but cannot be selected or its context cannot be created
struct NoAdapter : training_error {
    NoAdapter(std::string const &msg) : training_error(msg) {}
};

// runtime / driver / nvrtc failure after the device has been acquired
struct DeviceFault : training_error {
    DeviceFault(std::string const &msg) : training_error(msg) {}
};

struct InvalidConfig : training_error {
    InvalidConfig(std::string const &msg) : training_error(msg) {}
};

inline std::string error_location(char const *file, size_t line,
                                  std::string const &msg) {
    return std::string(file) + ":" + std::to_string(line) + ": " + msg;
}

#endif
