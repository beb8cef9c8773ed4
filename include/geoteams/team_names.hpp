#ifndef GEOTEAMS_TEAM_NAMES_HPP
#define GEOTEAMS_TEAM_NAMES_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace geoteams {

// "Team Alpha" .. "Team Zulu", then "Team Alpha 2" .. and so on.
std::vector<std::string> generate_team_names(size_t count);

}  // namespace geoteams

#endif  // GEOTEAMS_TEAM_NAMES_HPP
