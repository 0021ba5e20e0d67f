#ifndef SIZE_PARSER_HPP
#define SIZE_PARSER_HPP

#include "pforge/partition_spec.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <string_view>  // for string_view

namespace pforge::plan {

/// @brief Whether the caller accepts the remaining space sentinel
enum class SizeContext : std::uint8_t {
    /// EFI, Swap and Home require an explicit size
    FixedOnly,
    /// Root and custom partitions treat empty input or "0" as remaining space
    AllowRemaining
};

enum class SizeError : std::uint8_t {
    InvalidSizeFormat
};

auto size_error_to_string(SizeError error) noexcept -> std::string_view;

/// @brief Parses size token of form <digits><M|G>.
/// @param token The raw token, not trimmed.
/// @param context Whether empty input or "0" mean remaining space.
/// @return FixedSize or RemainingSpace, SizeError::InvalidSizeFormat otherwise.
[[nodiscard]] auto parse_size(std::string_view token, SizeContext context) noexcept
    -> std::expected<PartitionSize, SizeError>;

}  // namespace pforge::plan

#endif  // SIZE_PARSER_HPP
