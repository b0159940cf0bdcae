// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace scribe::core {

enum class TransferErrc {
    success = 0,
    invalid_input,
    out_of_range,
    invalid_state,
    invalid_url,
    invalid_config,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    connection_lost,
    server_error,
    rate_limited,
    client_error,
    unauthorized,
    not_found,
    malformed_response,
    session_rejected,
    checksum_mismatch,
    chunk_failed,
    finalize_failed,
    cancelled,
    poll_timeout,
    job_failed,
    job_cancelled,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "scribe::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:             return "Success";
            case TransferErrc::invalid_input:       return "Invalid input";
            case TransferErrc::out_of_range:        return "Chunk index out of range";
            case TransferErrc::invalid_state:       return "Invalid state transition";
            case TransferErrc::invalid_url:         return "Invalid URL";
            case TransferErrc::invalid_config:      return "Invalid configuration";
            case TransferErrc::network_error:       return "Network error";
            case TransferErrc::timeout:             return "Operation timed out";
            case TransferErrc::refused:             return "Connection refused";
            case TransferErrc::dns_error:           return "DNS resolution failed";
            case TransferErrc::ssl_error:           return "SSL/TLS error";
            case TransferErrc::connection_lost:     return "Connection lost";
            case TransferErrc::server_error:        return "Server error (5xx)";
            case TransferErrc::rate_limited:        return "Rate limited (429)";
            case TransferErrc::client_error:        return "Request rejected (4xx)";
            case TransferErrc::unauthorized:        return "Unauthorized (401/403)";
            case TransferErrc::not_found:           return "Resource not found (404)";
            case TransferErrc::malformed_response:  return "Malformed server response";
            case TransferErrc::session_rejected:    return "Upload session rejected";
            case TransferErrc::checksum_mismatch:   return "Checksum mismatch";
            case TransferErrc::chunk_failed:        return "Chunk upload failed";
            case TransferErrc::finalize_failed:     return "Session finalize failed";
            case TransferErrc::cancelled:           return "Cancelled";
            case TransferErrc::poll_timeout:        return "Timed out waiting for job";
            case TransferErrc::job_failed:          return "Transcription job failed";
            case TransferErrc::job_cancelled:       return "Transcription job cancelled by server";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

} // namespace scribe::core

namespace std {

template<>
struct is_error_code_enum<scribe::core::TransferErrc> : true_type {};

} // namespace std
