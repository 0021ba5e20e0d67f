#include "doctest_compatibility.h"

#include "pforge/size_parser.hpp"

#include <cstdint>
#include <string_view>

using namespace std::string_view_literals;

using pforge::plan::FixedSize;
using pforge::plan::parse_size;
using pforge::plan::RemainingSpace;
using pforge::plan::SizeContext;
using pforge::plan::SizeError;
using pforge::plan::SizeUnit;

namespace {

auto fixed_bytes(std::string_view token) -> std::uint64_t {
    const auto& size = parse_size(token, SizeContext::FixedOnly);
    REQUIRE(size.has_value());
    REQUIRE(std::holds_alternative<FixedSize>(*size));
    return std::get<FixedSize>(*size).bytes();
}

}  // namespace

TEST_CASE("size parser test")
{
    SECTION("mebibytes")
    {
        CHECK_EQ(fixed_bytes("512M"sv), 512ULL * 1024 * 1024);
        CHECK_EQ(fixed_bytes("1M"sv), 1ULL << 20);
        CHECK_EQ(fixed_bytes("0001M"sv), 1ULL << 20);
    }
    SECTION("gibibytes")
    {
        CHECK_EQ(fixed_bytes("8G"sv), 8ULL * 1024 * 1024 * 1024);
        CHECK_EQ(fixed_bytes("1G"sv), 1ULL << 30);
        CHECK_EQ(fixed_bytes("100G"sv), 100ULL << 30);
    }
    SECTION("magnitude and unit are kept")
    {
        const auto& size = parse_size("512M"sv, SizeContext::AllowRemaining);
        REQUIRE(size.has_value());
        CHECK(*size == pforge::plan::PartitionSize{FixedSize{.magnitude = 512, .unit = SizeUnit::Mebibytes}});
        CHECK_EQ(pforge::plan::size_to_string(*size), "512M");
        CHECK_EQ(pforge::plan::size_to_sgdisk(*size), "+512M");
    }
    SECTION("remaining space when allowed")
    {
        const auto& empty_token = parse_size(""sv, SizeContext::AllowRemaining);
        REQUIRE(empty_token.has_value());
        CHECK(std::holds_alternative<RemainingSpace>(*empty_token));

        const auto& zero_token = parse_size("0"sv, SizeContext::AllowRemaining);
        REQUIRE(zero_token.has_value());
        CHECK(std::holds_alternative<RemainingSpace>(*zero_token));
        CHECK_EQ(pforge::plan::size_to_sgdisk(*zero_token), "0");
    }
    SECTION("remaining space rejected for fixed sizes")
    {
        REQUIRE_EQ(parse_size(""sv, SizeContext::FixedOnly).error(), SizeError::InvalidSizeFormat);
        REQUIRE_EQ(parse_size("0"sv, SizeContext::FixedOnly).error(), SizeError::InvalidSizeFormat);
    }
    SECTION("invalid tokens")
    {
        for (auto&& token : {"512"sv, "M"sv, "G"sv, "512K"sv, "512m"sv, "8g"sv, "1.5G"sv, "-1G"sv, "+1G"sv,
                 " 512M"sv, "512M "sv, "5 12M"sv, "512MB"sv, "abc"sv, "0x10M"sv, "GM"sv}) {
            const auto& fixed = parse_size(token, SizeContext::FixedOnly);
            REQUIRE_FALSE(fixed.has_value());
            CHECK_EQ(fixed.error(), SizeError::InvalidSizeFormat);
            CHECK_FALSE(parse_size(token, SizeContext::AllowRemaining).has_value());
        }
    }
    SECTION("byte count overflow is rejected")
    {
        // 2^34 G == 2^64 bytes
        CHECK_FALSE(parse_size("17179869184G"sv, SizeContext::FixedOnly).has_value());
        CHECK(parse_size("17179869183G"sv, SizeContext::FixedOnly).has_value());
        CHECK_FALSE(parse_size("99999999999999999999999M"sv, SizeContext::FixedOnly).has_value());
    }
    SECTION("zero magnitude with unit is well formed")
    {
        const auto& size = parse_size("0M"sv, SizeContext::FixedOnly);
        REQUIRE(size.has_value());
        CHECK_EQ(std::get<FixedSize>(*size).bytes(), 0ULL);
    }
}
