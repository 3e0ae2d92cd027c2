#ifndef FRNN_LOG_HPP
#define FRNN_LOG_HPP

#include <cstdio>

namespace frnn {

// True when FRNN_LOG starts with 1/y/Y. Read once per process.
bool log_enabled();

}  // namespace frnn

#define FRNN_LOG(fmt, ...) \
    do { if (::frnn::log_enabled()) std::fprintf(stderr, "[frnn] " fmt "\n", ##__VA_ARGS__); } while (0)

// Verbose-flag variant used by construct paths.
#define FRNN_VLOG(verbose, fmt, ...) \
    do { if ((verbose) || ::frnn::log_enabled()) std::fprintf(stderr, "[frnn] " fmt "\n", ##__VA_ARGS__); } while (0)

#endif  // FRNN_LOG_HPP
