#ifndef GEOTEAMS_ERRORS_HPP
#define GEOTEAMS_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geoteams {

// Malformed request: bad K, too few names, unresolved or out-of-range
// coordinates, duplicate identifiers, nonsensical configuration.
class InputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The capacity bound cannot be met. Callers are expected to adjust K or the
// bound and resubmit the whole request. largest_group() is the biggest group
// at the time of failure; for UnsafeLoad it is the total point count.
class CapacityError : public std::runtime_error {
public:
    enum class Reason {
        SingleGroupOverload,
        Saturated,
        NoCandidate,
        IterationCap,
        UnsafeLoad,
    };

    CapacityError(Reason reason, const std::string& what, size_t groups,
                  size_t capacity, size_t largest_group)
        : std::runtime_error(what),
          reason_(reason),
          groups_(groups),
          capacity_(capacity),
          largest_group_(largest_group) {}

    Reason reason() const noexcept { return reason_; }
    size_t groups() const noexcept { return groups_; }
    size_t capacity() const noexcept { return capacity_; }
    size_t largest_group() const noexcept { return largest_group_; }

private:
    Reason reason_;
    size_t groups_;
    size_t capacity_;
    size_t largest_group_;
};

const char* to_string(CapacityError::Reason reason);

}  // namespace geoteams

#endif  // GEOTEAMS_ERRORS_HPP
