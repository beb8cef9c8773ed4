#ifndef GEOTEAMS_LOG_HPP
#define GEOTEAMS_LOG_HPP

#include <cstdio>

namespace geoteams {

// True when GEOTEAMS_LOG is set to 1/y/Y. Read once per process.
bool log_enabled();

}  // namespace geoteams

#define GEOTEAMS_LOG(tag, fmt, ...) \
    do { if (::geoteams::log_enabled()) std::fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__); } while (0)

#endif  // GEOTEAMS_LOG_HPP
