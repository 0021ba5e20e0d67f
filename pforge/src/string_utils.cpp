#include "pforge/string_utils.hpp"

#include <algorithm>  // for for_each, reverse

namespace pforge::utils {

auto make_multiline(std::string_view str, bool reverse, char delim) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    if (reverse) {
        std::ranges::reverse(lines);
    }
    return lines;
}

auto join(const std::vector<std::string>& lines, char delim) noexcept -> std::string {
    std::string res{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            res += delim;
        }
        res += lines[i];
    }
    return res;
}

auto trim(std::string_view str) noexcept -> std::string_view {
    static constexpr std::string_view whitespace{" \t\r\n\v\f"};

    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

}  // namespace pforge::utils
