#include "pforge/layout_executor.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace pforge::disk {

auto layout_state_to_string(LayoutState state) noexcept -> std::string_view {
    switch (state) {
    case LayoutState::Unwiped:
        return "unwiped"sv;
    case LayoutState::Wiped:
        return "wiped"sv;
    case LayoutState::PartitionsCreated:
        return "partitionsCreated"sv;
    case LayoutState::TableRefreshed:
        return "tableRefreshed"sv;
    case LayoutState::Failed:
        return "failed"sv;
    }
    return "unknown"sv;
}

auto layout_stage_to_string(LayoutStage stage) noexcept -> std::string_view {
    switch (stage) {
    case LayoutStage::Wipe:
        return "wipe"sv;
    case LayoutStage::CreatePartition:
        return "createPartition"sv;
    case LayoutStage::Refresh:
        return "refresh"sv;
    }
    return "unknown"sv;
}

auto layout_failure_to_string(const LayoutFailure& failure) -> std::string {
    if (failure.stage == LayoutStage::CreatePartition) {
        return fmt::format(FMT_COMPILE("{}: {}"), layout_stage_to_string(failure.stage), failure.index);
    }
    return std::string{layout_stage_to_string(failure.stage)};
}

LayoutExecutor::LayoutExecutor(DiskOperations& disk_ops, DeviceTarget target, ProgressCallback progress) noexcept
  : m_disk_ops(disk_ops), m_target(std::move(target)), m_progress(std::move(progress)) { }

void LayoutExecutor::notify(ProgressEvent event, std::string_view description) const noexcept {
    if (m_progress) {
        m_progress(event, description);
    }
}

auto LayoutExecutor::fail(LayoutStage stage, std::uint32_t index, std::string diagnostic) noexcept -> std::expected<void, LayoutFailure> {
    m_state   = LayoutState::Failed;
    m_failure = LayoutFailure{.stage = stage, .index = index, .diagnostic = std::move(diagnostic)};
    spdlog::error("[layout] Failed({}) on {}: {}", layout_failure_to_string(*m_failure), m_target.device, m_failure->diagnostic);
    return std::unexpected(*m_failure);
}

auto LayoutExecutor::run(const plan::PartitionPlan& plan) noexcept -> std::expected<void, LayoutFailure> {
    if (m_state == LayoutState::Failed) {
        return std::unexpected(*m_failure);
    }
    if (m_state == LayoutState::TableRefreshed) {
        return {};
    }

    const auto& device = m_target.device;
    spdlog::info("[layout] Partitioning disk: {}", device);

    // unwiped -> wiped
    {
        const auto& description = fmt::format(FMT_COMPILE("Wiping existing GPT data structures on {}"), device);
        notify(ProgressEvent::Started, description);
        if (auto wiped = m_disk_ops.wipe_table(device); !wiped) {
            notify(ProgressEvent::Failed, description);
            return fail(LayoutStage::Wipe, 0, std::move(wiped.error()));
        }
        notify(ProgressEvent::Completed, description);
        m_state = LayoutState::Wiped;
        spdlog::info("[layout] {}: ok", layout_stage_to_string(LayoutStage::Wipe));
    }

    // wiped -> partitionsCreated
    for (const auto& spec : plan) {
        const auto& request     = make_partition_request(spec);
        const auto& description = fmt::format(FMT_COMPILE("Creating {} partition #{} ({})"), plan::display_name(spec), spec.index, plan::size_to_string(spec.size));
        notify(ProgressEvent::Started, description);
        if (auto created = m_disk_ops.create_partition(device, request); !created) {
            notify(ProgressEvent::Failed, description);
            return fail(LayoutStage::CreatePartition, spec.index, std::move(created.error()));
        }
        notify(ProgressEvent::Completed, description);
        spdlog::info("[layout] {}: {} ok (size={}, type={}, label='{}')", layout_stage_to_string(LayoutStage::CreatePartition),
            spec.index, request.size, request.type_code, request.label);
    }
    m_state = LayoutState::PartitionsCreated;

    // partitionsCreated -> tableRefreshed
    {
        const auto& description = fmt::format(FMT_COMPILE("Refreshing partition table of {}"), device);
        notify(ProgressEvent::Started, description);
        if (auto refreshed = m_disk_ops.refresh_table(device); !refreshed) {
            notify(ProgressEvent::Failed, description);
            return fail(LayoutStage::Refresh, 0, std::move(refreshed.error()));
        }
        notify(ProgressEvent::Completed, description);
        m_state = LayoutState::TableRefreshed;
        spdlog::info("[layout] {}: ok", layout_stage_to_string(LayoutStage::Refresh));
    }
    return {};
}

}  // namespace pforge::disk
