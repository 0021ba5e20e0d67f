#include "pforge/format_dispatcher.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace pforge::disk {

auto format_stage_to_string(FormatStage stage) noexcept -> std::string_view {
    switch (stage) {
    case FormatStage::UnsupportedFilesystemForRole:
        return "unsupportedFilesystemForRole"sv;
    case FormatStage::WipeSignature:
        return "wipeSignature"sv;
    case FormatStage::Format:
        return "format"sv;
    }
    return "unknown"sv;
}

auto format_failure_to_string(const FormatFailure& failure) -> std::string {
    return fmt::format(FMT_COMPILE("{}: {}"), format_stage_to_string(failure.stage), failure.index);
}

FormatDispatcher::FormatDispatcher(DiskOperations& disk_ops, DeviceTarget target, ProgressCallback progress) noexcept
  : m_disk_ops(disk_ops), m_target(std::move(target)), m_progress(std::move(progress)) { }

void FormatDispatcher::notify(ProgressEvent event, std::string_view description) const noexcept {
    if (m_progress) {
        m_progress(event, description);
    }
}

auto FormatDispatcher::validate(const plan::PartitionPlan& plan) noexcept -> std::expected<void, FormatFailure> {
    for (const auto& spec : plan) {
        const bool is_home_fat = spec.role == plan::PartitionRole::Home && spec.filesystem == fs::FilesystemType::Fat32;
        if (is_home_fat || spec.filesystem == fs::FilesystemType::Unknown) {
            auto&& diagnostic = fmt::format(FMT_COMPILE("{} partition cannot be formatted as {}"),
                plan::display_name(spec), fs::filesystem_type_to_string(spec.filesystem));
            spdlog::error("[format] {}", diagnostic);
            return std::unexpected(FormatFailure{.stage = FormatStage::UnsupportedFilesystemForRole, .index = spec.index, .diagnostic = std::move(diagnostic)});
        }
    }
    return {};
}

auto FormatDispatcher::format_one(const plan::PartitionSpec& spec) noexcept -> std::expected<void, FormatFailure> {
    const auto& partition = m_target.partition_path(spec.index);
    const auto& name      = plan::display_name(spec);

    if (is_format_skipped(spec)) {
        spdlog::warn("[format] {} partition ({}) is already FAT32-formatted from partition creation. Skipping formatting.", name, partition);
        return {};
    }

    const auto fs_type = spec.filesystem;
    const auto& description = fmt::format(FMT_COMPILE("Formatting {} partition ({}) as {}"), name, partition, fs::filesystem_type_to_string(fs_type));
    notify(ProgressEvent::Started, description);

    if (auto wiped = m_disk_ops.wipe_signatures(partition); !wiped) {
        notify(ProgressEvent::Failed, description);
        spdlog::error("[format] Failed({}: {}) on {}: {}", format_stage_to_string(FormatStage::WipeSignature), spec.index, partition, wiped.error());
        return std::unexpected(FormatFailure{.stage = FormatStage::WipeSignature, .index = spec.index, .diagnostic = std::move(wiped.error())});
    }

    auto formatted = (fs_type == fs::FilesystemType::Swap)
        ? m_disk_ops.make_swap(partition)
        : m_disk_ops.format_filesystem(partition, fs_type, plan::volume_label(spec));
    if (!formatted) {
        notify(ProgressEvent::Failed, description);
        spdlog::error("[format] Failed({}: {}) on {}: {}", format_stage_to_string(FormatStage::Format), spec.index, partition, formatted.error());
        return std::unexpected(FormatFailure{.stage = FormatStage::Format, .index = spec.index, .diagnostic = std::move(formatted.error())});
    }

    notify(ProgressEvent::Completed, description);
    spdlog::info("[format] {}: ok", description);
    return {};
}

auto FormatDispatcher::run(const plan::PartitionPlan& plan) noexcept -> std::expected<void, FormatFailure> {
    if (auto valid = validate(plan); !valid) {
        return valid;
    }

    spdlog::info("[format] Formatting partitions of {}", m_target.device);
    for (const auto& spec : plan) {
        if (auto formatted = format_one(spec); !formatted) {
            return formatted;
        }
    }
    return {};
}

}  // namespace pforge::disk
