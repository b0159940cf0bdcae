// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/error.hpp>
#include <scribe/core/file_handle.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::core {

enum class ChunkStatus : std::uint8_t {
    pending,    // Never attempted
    in_flight,  // Owned by exactly one upload attempt
    acked,      // Server acknowledged
    failed      // Last attempt failed; eligible for retry
};

[[nodiscard]] std::string_view to_string(ChunkStatus status) noexcept;

struct ChunkDescriptor {
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

struct ChunkState {
    ChunkStatus status{ChunkStatus::pending};
    std::uint32_t attempts{0};
    std::error_code last_error;
    std::string last_detail;
};

// Chunk layout for one file plus the per-chunk transfer state.
// chunks[i].index == i and the offsets partition [0, file_size).
struct ChunkPlan {
    std::uint64_t file_size{0};
    std::uint64_t chunk_size{0};
    std::vector<ChunkDescriptor> chunks;
    std::vector<ChunkState> states;

    [[nodiscard]] std::size_t size() const noexcept { return chunks.size(); }
    [[nodiscard]] bool contains(std::uint32_t index) const noexcept { return index < chunks.size(); }
};

class ChunkStore {
public:
    // ceil(file_size / chunk_size) chunks; invalid_input when chunk_size <= 0
    // or file_size == 0
    [[nodiscard]] static std::expected<ChunkPlan, std::error_code>
    plan(std::uint64_t file_size, std::int64_t chunk_size) noexcept;

    [[nodiscard]] static std::expected<ChunkPlan, std::error_code>
    plan(const FileHandle& file, std::int64_t chunk_size) noexcept;

    [[nodiscard]] static std::error_code mark_acked(ChunkPlan& plan, std::uint32_t index) noexcept;

    [[nodiscard]] static std::error_code mark_failed(ChunkPlan& plan, std::uint32_t index,
                                                     std::error_code error,
                                                     std::string_view detail = {}) noexcept;

    // Pending/Failed -> InFlight, counting one attempt
    [[nodiscard]] static std::error_code mark_in_flight(ChunkPlan& plan, std::uint32_t index) noexcept;

    // Pending or Failed chunks, ascending
    [[nodiscard]] static std::vector<std::uint32_t> pending_indices(const ChunkPlan& plan);

    [[nodiscard]] static std::size_t acked_count(const ChunkPlan& plan) noexcept;
    [[nodiscard]] static bool all_acked(const ChunkPlan& plan) noexcept;
    [[nodiscard]] static std::uint64_t acked_bytes(const ChunkPlan& plan) noexcept;
};

} // namespace scribe::core
