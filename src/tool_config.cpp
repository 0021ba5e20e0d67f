#include "tool_config.hpp"

// import pforge
#include "pforge/io_utils.hpp"
#include "pforge/size_parser.hpp"
#include "pforge/string_utils.hpp"

#include <array>        // for array
#include <expected>     // for expected, unexpected
#include <filesystem>   // for exists
#include <fstream>      // for ifstream
#include <iterator>     // for istreambuf_iterator
#include <string_view>  // for string_view
#include <utility>      // for move
#include <variant>      // for get_if

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using StringField = std::expected<std::optional<std::string>, std::string>;

// Missing member is not an error, a member of wrong type is.
auto get_string_member(const rapidjson::Value& object, const char* key) noexcept -> StringField {
    if (!object.HasMember(key)) {
        return std::optional<std::string>{};
    }
    if (!object[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    return std::optional<std::string>{object[key].GetString()};
}

auto parse_partition_entry(const rapidjson::Value& part_value) noexcept -> std::expected<partforge::PartitionEntry, std::string> {
    using pforge::plan::PartitionRole;

    if (!part_value.IsObject()) {
        return std::unexpected("Each partition must be an object");
    }
    if (!part_value.HasMember("role") || !part_value["role"].IsString()) {
        return std::unexpected("Partition 'role' is required and must be a string");
    }
    if (!part_value.HasMember("size") || !part_value["size"].IsString()) {
        return std::unexpected("Partition 'size' is required and must be a string");
    }
    if (!part_value.HasMember("fs_name") || !part_value["fs_name"].IsString()) {
        return std::unexpected("Partition 'fs_name' is required and must be a string");
    }

    const std::string_view role_str{part_value["role"].GetString()};
    const auto& role = pforge::plan::string_to_partition_role(role_str);
    if (!role || *role == PartitionRole::Efi || *role == PartitionRole::Swap) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid partition role '{}'. Valid roles: root, home, custom"), role_str));
    }

    const std::string_view fs_name{part_value["fs_name"].GetString()};
    const auto filesystem = pforge::fs::string_to_filesystem_type(fs_name);
    if (filesystem == pforge::fs::FilesystemType::Unknown) {
        return std::unexpected(fmt::format(FMT_COMPILE("Unknown filesystem '{}'"), fs_name));
    }

    auto name = get_string_member(part_value, "name");
    if (!name) {
        return std::unexpected(fmt::format(FMT_COMPILE("Partition {}"), name.error()));
    }
    if (*role == PartitionRole::Custom && (!*name || (*name)->empty())) {
        return std::unexpected("Partition 'name' is required for custom partitions");
    }

    return partforge::PartitionEntry{
        .role       = *role,
        .size       = part_value["size"].GetString(),
        .filesystem = filesystem,
        .name       = name->value_or(std::string{}),
    };
}

auto parse_custom_mount(const rapidjson::Value& mount_value) noexcept -> std::expected<pforge::mount::CustomMount, std::string> {
    if (!mount_value.IsObject()) {
        return std::unexpected("Each custom mount must be an object");
    }
    if (!mount_value.HasMember("device") || !mount_value["device"].IsString()) {
        return std::unexpected("Custom mount 'device' is required and must be a string");
    }
    if (!mount_value.HasMember("mountpoint") || !mount_value["mountpoint"].IsString()) {
        return std::unexpected("Custom mount 'mountpoint' is required and must be a string");
    }
    return pforge::mount::CustomMount{
        .device     = mount_value["device"].GetString(),
        .mountpoint = mount_value["mountpoint"].GetString(),
    };
}

auto join_missing_fields(const std::vector<std::string_view>& fields) noexcept -> std::string {
    std::string missing_fields;
    for (const auto& field : fields) {
        missing_fields += fmt::format(FMT_COMPILE("'{}', "), field);
    }
    if (!missing_fields.empty()) {
        missing_fields.resize(missing_fields.size() - 2);
    }
    return missing_fields;
}

auto parse_fixed_size(std::string_view field, std::string_view token) noexcept -> std::expected<pforge::plan::FixedSize, std::string> {
    auto size = pforge::plan::parse_size(pforge::utils::trim(token), pforge::plan::SizeContext::FixedOnly);
    if (!size) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid '{}' '{}': {}"), field, token, pforge::plan::size_error_to_string(size.error())));
    }
    const auto* fixed = std::get_if<pforge::plan::FixedSize>(&*size);
    if (fixed == nullptr) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid '{}' '{}': an explicit size is required"), field, token));
    }
    return *fixed;
}

}  // namespace

namespace partforge {

auto get_default_config() noexcept -> ToolConfig {
    return ToolConfig{
        .headless_mode = false,
        .log_dir       = ".",
        .mountpoint    = "/mnt/gentoo",
        .efi_size      = "512M",
        .swap_size     = "8G",
    };
}

auto parse_tool_config(std::string_view json_content) noexcept
    -> std::expected<ToolConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    // Parse headless_mode (optional, default false)
    if (doc.HasMember("headless_mode")) {
        if (!doc["headless_mode"].IsBool()) {
            return std::unexpected("'headless_mode' must be a boolean");
        }
        config.headless_mode = doc["headless_mode"].GetBool();
    }

    // Plain string settings with defaults
    const std::array<std::pair<const char*, std::string*>, 4> defaulted_fields{{
        {"log_dir", &config.log_dir},
        {"mountpoint", &config.mountpoint},
        {"efi_size", &config.efi_size},
        {"swap_size", &config.swap_size},
    }};
    for (const auto& [key, target] : defaulted_fields) {
        auto value = get_string_member(doc, key);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        if (*value) {
            *target = std::move(**value);
        }
    }

    // Devices, required only in headless mode
    const std::array<std::pair<const char*, std::optional<std::string>*>, 4> device_fields{{
        {"device", &config.device},
        {"swap_device", &config.swap_device},
        {"root_device", &config.root_device},
        {"efi_device", &config.efi_device},
    }};
    for (const auto& [key, target] : device_fields) {
        auto value = get_string_member(doc, key);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        *target = std::move(*value);
    }

    if (config.mountpoint.empty() || !config.mountpoint.starts_with('/')) {
        return std::unexpected(fmt::format(FMT_COMPILE("'mountpoint' must be an absolute path, got '{}'"), config.mountpoint));
    }

    // Parse partitions (optional, but required in headless mode)
    if (doc.HasMember("partitions")) {
        if (!doc["partitions"].IsArray()) {
            return std::unexpected("'partitions' must be an array");
        }
        for (const auto& part_value : doc["partitions"].GetArray()) {
            auto entry = parse_partition_entry(part_value);
            if (!entry) {
                return std::unexpected(std::move(entry.error()));
            }
            config.partitions.push_back(std::move(*entry));
        }
    }

    // Parse custom_mounts (optional)
    if (doc.HasMember("custom_mounts")) {
        if (!doc["custom_mounts"].IsArray()) {
            return std::unexpected("'custom_mounts' must be an array");
        }
        for (const auto& mount_value : doc["custom_mounts"].GetArray()) {
            auto custom = parse_custom_mount(mount_value);
            if (!custom) {
                return std::unexpected(std::move(custom.error()));
            }
            config.custom_mounts.push_back(std::move(*custom));
        }
    }

    return config;
}

auto load_tool_config() noexcept -> std::expected<ToolConfig, std::string> {
    auto config_path = std::string{pforge::utils::safe_getenv("PARTFORGE_CONFIG")};
    if (config_path.empty()) {
        config_path = std::string{DEFAULT_CONFIG_PATH};
    }

    std::error_code err{};
    if (!std::filesystem::exists(config_path, err)) {
        return get_default_config();
    }

    std::ifstream config_file{config_path, std::ios::binary};
    if (!config_file.is_open()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open config '{}'"), config_path));
    }
    const std::string content{std::istreambuf_iterator<char>{config_file}, std::istreambuf_iterator<char>{}};

    auto config = parse_tool_config(content);
    if (!config) {
        return std::unexpected(fmt::format(FMT_COMPILE("{}: {}"), config_path, config.error()));
    }
    return config;
}

auto validate_partition_headless(const ToolConfig& config) noexcept
    -> std::expected<void, std::string> {
    if (!config.headless_mode) {
        return {};
    }

    std::vector<std::string_view> missing_fields{};
    if (!config.device || config.device->empty()) {
        missing_fields.emplace_back("device"sv);
    }
    if (config.partitions.empty()) {
        missing_fields.emplace_back("partitions"sv);
    }

    if (!missing_fields.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("HEADLESS mode requires: {}"), join_missing_fields(missing_fields)));
    }
    return {};
}

auto validate_mount_headless(const ToolConfig& config) noexcept
    -> std::expected<void, std::string> {
    if (!config.headless_mode) {
        return {};
    }

    std::vector<std::string_view> missing_fields{};
    if (!config.swap_device || config.swap_device->empty()) {
        missing_fields.emplace_back("swap_device"sv);
    }
    if (!config.root_device || config.root_device->empty()) {
        missing_fields.emplace_back("root_device"sv);
    }
    if (!config.efi_device || config.efi_device->empty()) {
        missing_fields.emplace_back("efi_device"sv);
    }

    if (!missing_fields.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("HEADLESS mode requires: {}"), join_missing_fields(missing_fields)));
    }
    return {};
}

auto build_plan_from_config(const ToolConfig& config) noexcept
    -> std::expected<pforge::plan::PartitionPlan, std::string> {
    using pforge::plan::PartitionRole;
    using pforge::plan::SizeContext;

    pforge::plan::PlanBuilder builder{};

    const auto& efi_size = parse_fixed_size("efi_size"sv, config.efi_size);
    if (!efi_size) {
        return std::unexpected(efi_size.error());
    }
    if (auto res = builder.add_fixed_role(PartitionRole::Efi, *efi_size, pforge::fs::FilesystemType::Fat32); !res) {
        return std::unexpected(fmt::format(FMT_COMPILE("EFI partition: {}"), pforge::plan::plan_error_to_string(res.error())));
    }

    const auto& swap_size = parse_fixed_size("swap_size"sv, config.swap_size);
    if (!swap_size) {
        return std::unexpected(swap_size.error());
    }
    if (auto res = builder.add_fixed_role(PartitionRole::Swap, *swap_size, pforge::fs::FilesystemType::Swap); !res) {
        return std::unexpected(fmt::format(FMT_COMPILE("Swap partition: {}"), pforge::plan::plan_error_to_string(res.error())));
    }

    for (const auto& entry : config.partitions) {
        const auto role_name = pforge::plan::partition_role_to_string(entry.role);
        const auto context   = (entry.role == PartitionRole::Home) ? SizeContext::FixedOnly : SizeContext::AllowRemaining;

        const auto& size = pforge::plan::parse_size(pforge::utils::trim(entry.size), context);
        if (!size) {
            return std::unexpected(fmt::format(FMT_COMPILE("{} partition: invalid size '{}': {}"), role_name, entry.size, pforge::plan::size_error_to_string(size.error())));
        }
        if (auto res = builder.add_sized_role(entry.role, *size, entry.filesystem, entry.name); !res) {
            return std::unexpected(fmt::format(FMT_COMPILE("{} partition: {}"), role_name, pforge::plan::plan_error_to_string(res.error())));
        }
    }

    auto plan = builder.finalize();
    if (!plan) {
        return std::unexpected(std::string{pforge::plan::plan_error_to_string(plan.error())});
    }
    return std::move(*plan);
}

auto mount_request_from_config(const ToolConfig& config) noexcept -> pforge::mount::MountRequest {
    return pforge::mount::MountRequest{
        .swap_device     = config.swap_device.value_or(std::string{}),
        .root_device     = config.root_device.value_or(std::string{}),
        .efi_device      = config.efi_device.value_or(std::string{}),
        .custom_mounts   = config.custom_mounts,
        .root_mountpoint = config.mountpoint,
    };
}

}  // namespace partforge
