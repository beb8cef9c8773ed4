#include "geoteams/errors.hpp"

namespace geoteams {

const char* to_string(CapacityError::Reason reason) {
    switch (reason) {
        case CapacityError::Reason::SingleGroupOverload: return "single_group_overload";
        case CapacityError::Reason::Saturated:           return "saturated";
        case CapacityError::Reason::NoCandidate:         return "no_candidate";
        case CapacityError::Reason::IterationCap:        return "iteration_cap";
        case CapacityError::Reason::UnsafeLoad:          return "unsafe_load";
    }
    return "unknown";
}

}  // namespace geoteams
