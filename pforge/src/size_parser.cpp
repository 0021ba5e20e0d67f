#include "pforge/size_parser.hpp"

#include <charconv>  // for from_chars
#include <limits>    // for numeric_limits

using namespace std::string_view_literals;

namespace pforge::plan {

auto size_error_to_string(SizeError error) noexcept -> std::string_view {
    switch (error) {
    case SizeError::InvalidSizeFormat:
        return "Invalid size format. Use numbers followed by M or G (e.g., 512M, 8G)."sv;
    }
    return "unknown size error"sv;
}

auto parse_size(std::string_view token, SizeContext context) noexcept
    -> std::expected<PartitionSize, SizeError> {
    if (token.empty() || token == "0"sv) {
        if (context == SizeContext::AllowRemaining) {
            return RemainingSpace{};
        }
        return std::unexpected(SizeError::InvalidSizeFormat);
    }

    // ^[0-9]+[MG]$
    const auto unit_char = token.back();
    if (unit_char != 'M' && unit_char != 'G') {
        return std::unexpected(SizeError::InvalidSizeFormat);
    }
    const auto digits = token.substr(0, token.size() - 1);
    if (digits.empty() || digits.find_first_not_of("0123456789"sv) != std::string_view::npos) {
        return std::unexpected(SizeError::InvalidSizeFormat);
    }

    std::uint64_t magnitude{};
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::unexpected(SizeError::InvalidSizeFormat);
    }

    const auto unit = (unit_char == 'G') ? SizeUnit::Gibibytes : SizeUnit::Mebibytes;
    const auto shift = (unit == SizeUnit::Gibibytes) ? 30U : 20U;
    if (magnitude > (std::numeric_limits<std::uint64_t>::max() >> shift)) {
        return std::unexpected(SizeError::InvalidSizeFormat);
    }
    return FixedSize{.magnitude = magnitude, .unit = unit};
}

}  // namespace pforge::plan
