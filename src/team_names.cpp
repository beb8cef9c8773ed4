#include "geoteams/team_names.hpp"

#include <absl/strings/str_format.h>

#include <array>

namespace geoteams {

namespace {

constexpr std::array<const char*, 26> kNato = {
    "Alpha",  "Bravo",   "Charlie", "Delta",  "Echo",    "Foxtrot", "Golf",
    "Hotel",  "India",   "Juliet",  "Kilo",   "Lima",    "Mike",    "November",
    "Oscar",  "Papa",    "Quebec",  "Romeo",  "Sierra",  "Tango",   "Uniform",
    "Victor", "Whiskey", "X-ray",   "Yankee", "Zulu",
};

}  // namespace

std::vector<std::string> generate_team_names(size_t count) {
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        size_t cycle = i / kNato.size();
        const char* word = kNato[i % kNato.size()];
        if (cycle == 0)
            names.push_back(absl::StrFormat("Team %s", word));
        else
            names.push_back(absl::StrFormat("Team %s %zu", word, cycle + 1));
    }
    return names;
}

}  // namespace geoteams
