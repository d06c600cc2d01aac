/// @file src/core/types.cpp
/// @brief Episode id comparison.

#include "trainlog/types.hpp"

namespace trainlog {

int compare_episode_ids(std::string_view a, std::string_view b) noexcept {
    const auto strip = [](std::string_view s) noexcept {
        const auto first = s.find_first_not_of('0');
        return first == std::string_view::npos ? std::string_view{} : s.substr(first);
    };
    a = strip(a);
    b = strip(b);

    // Without leading zeros a longer digit string is a larger number.
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    const int cmp = a.compare(b);
    return (cmp > 0) - (cmp < 0);
}

} // namespace trainlog
