#include "geoteams/log.hpp"

#include <cstdlib>

namespace geoteams {

bool log_enabled() {
    static bool once = []() {
        const char* e = std::getenv("GEOTEAMS_LOG");
        return e && (e[0] == '1' || e[0] == 'y' || e[0] == 'Y');
    }();
    return once;
}

}  // namespace geoteams
