// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/chunk_store.hpp>
#include <algorithm>
#include <limits>

namespace scribe::core {

std::string_view to_string(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::pending:   return "pending";
        case ChunkStatus::in_flight: return "in_flight";
        case ChunkStatus::acked:     return "acked";
        case ChunkStatus::failed:    return "failed";
    }
    return "unknown";
}

//=============================================================================
// Planning
//=============================================================================

std::expected<ChunkPlan, std::error_code>
ChunkStore::plan(std::uint64_t file_size, std::int64_t chunk_size) noexcept {
    if (chunk_size <= 0 || file_size == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_input));
    }

    const auto step = static_cast<std::uint64_t>(chunk_size);
    const std::uint64_t count = (file_size + step - 1) / step;
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_input));
    }

    try {
        ChunkPlan plan;
        plan.file_size = file_size;
        plan.chunk_size = step;
        plan.chunks.reserve(static_cast<std::size_t>(count));

        std::uint64_t offset = 0;
        for (std::uint32_t i = 0; i < count; ++i) {
            const std::uint64_t length = std::min(step, file_size - offset);
            plan.chunks.push_back({i, offset, length});
            offset += length;
        }
        plan.states.resize(plan.chunks.size());
        return plan;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_input));
    }
}

std::expected<ChunkPlan, std::error_code>
ChunkStore::plan(const FileHandle& file, std::int64_t chunk_size) noexcept {
    return plan(file.size, chunk_size);
}

//=============================================================================
// State transitions
//=============================================================================

std::error_code ChunkStore::mark_acked(ChunkPlan& plan, std::uint32_t index) noexcept {
    if (!plan.contains(index)) {
        return make_error_code(TransferErrc::out_of_range);
    }
    auto& state = plan.states[index];
    state.status = ChunkStatus::acked;
    state.last_error.clear();
    state.last_detail.clear();
    return {};
}

std::error_code ChunkStore::mark_failed(ChunkPlan& plan, std::uint32_t index,
                                        std::error_code error,
                                        std::string_view detail) noexcept {
    if (!plan.contains(index)) {
        return make_error_code(TransferErrc::out_of_range);
    }
    auto& state = plan.states[index];
    if (state.status == ChunkStatus::acked) {
        return make_error_code(TransferErrc::invalid_state);
    }
    state.status = ChunkStatus::failed;
    state.last_error = error;
    try {
        state.last_detail.assign(detail);
    } catch (const std::bad_alloc&) {
        state.last_detail.clear();
    }
    return {};
}

std::error_code ChunkStore::mark_in_flight(ChunkPlan& plan, std::uint32_t index) noexcept {
    if (!plan.contains(index)) {
        return make_error_code(TransferErrc::out_of_range);
    }
    auto& state = plan.states[index];
    if (state.status == ChunkStatus::in_flight || state.status == ChunkStatus::acked) {
        return make_error_code(TransferErrc::invalid_state);
    }
    state.status = ChunkStatus::in_flight;
    ++state.attempts;
    return {};
}

//=============================================================================
// Queries
//=============================================================================

std::vector<std::uint32_t> ChunkStore::pending_indices(const ChunkPlan& plan) {
    std::vector<std::uint32_t> out;
    for (std::uint32_t i = 0; i < plan.states.size(); ++i) {
        auto status = plan.states[i].status;
        if (status == ChunkStatus::pending || status == ChunkStatus::failed) {
            out.push_back(i);
        }
    }
    return out;
}

std::size_t ChunkStore::acked_count(const ChunkPlan& plan) noexcept {
    return static_cast<std::size_t>(std::count_if(plan.states.begin(), plan.states.end(),
        [](const ChunkState& s) { return s.status == ChunkStatus::acked; }));
}

bool ChunkStore::all_acked(const ChunkPlan& plan) noexcept {
    return !plan.states.empty() && acked_count(plan) == plan.states.size();
}

std::uint64_t ChunkStore::acked_bytes(const ChunkPlan& plan) noexcept {
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < plan.states.size(); ++i) {
        if (plan.states[i].status == ChunkStatus::acked) {
            total += plan.chunks[i].length;
        }
    }
    return total;
}

} // namespace scribe::core
