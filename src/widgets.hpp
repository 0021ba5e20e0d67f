#ifndef WIDGETS_HPP
#define WIDGETS_HPP

// import pforge
#include "pforge/block_devices.hpp"
#include "pforge/partition_spec.hpp"
#include "pforge/size_parser.hpp"

#include <functional>   // for function
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace tui::detail {

inline constexpr std::string_view SCREEN_TITLE{"partforge"};

/// @brief Checks submitted input.
/// @return Message shown below the input box, std::nullopt to accept the value.
using InputCheck = std::function<std::optional<std::string>(std::string_view)>;

/// @brief Menu line of a filesystem, e.g "xfs    (high performance, good for large storage)"
auto filesystem_entry(pforge::fs::FilesystemType fs_type) noexcept -> std::string;

/// @brief Menu line of a disk, e.g "/dev/sda             Size: 465.8GiB   Samsung SSD 860"
auto disk_entry(const pforge::disk::DiskInfo& disk) noexcept -> std::string;

/// @brief Message shown below the size input when the token is rejected.
auto size_error_hint(std::string_view token, pforge::plan::SizeError error) noexcept -> std::string;

void message_widget(std::string_view content) noexcept;
bool yesno_widget(std::string_view question) noexcept;

/// @brief Text input which stays open until check accepts the trimmed value.
/// @return The accepted value, std::nullopt on cancel.
auto input_widget(std::string_view question, std::string_view initial, const InputCheck& check) noexcept -> std::optional<std::string>;

/// @brief Size input, invalid tokens are reported inline and asked again.
/// @return The parsed size, std::nullopt on cancel.
auto size_input_widget(std::string_view question, std::string_view default_token, pforge::plan::SizeContext context) noexcept
    -> std::optional<pforge::plan::PartitionSize>;

auto filesystem_menu_widget(std::string_view title, std::span<const pforge::fs::FilesystemType> filesystems) noexcept
    -> std::optional<pforge::fs::FilesystemType>;

/// @return Device path of the chosen disk, std::nullopt on cancel.
auto disk_menu_widget(std::string_view title, const std::vector<pforge::disk::DiskInfo>& disks) noexcept -> std::optional<std::string>;

}  // namespace tui::detail

#endif  // WIDGETS_HPP
