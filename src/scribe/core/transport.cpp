// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/transport.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace scribe::core {

std::string_view to_string(ErrorClass kind) noexcept {
    switch (kind) {
        case ErrorClass::transient:    return "transient";
        case ErrorClass::permanent:    return "permanent";
        case ErrorClass::rate_limited: return "rate-limited";
    }
    return "unknown";
}

//=============================================================================
// TransportError
//=============================================================================

std::string TransportError::message() const {
    std::string out = code ? code.message() : std::string("Transport error");
    if (http_status != 0) {
        out += " [HTTP " + std::to_string(http_status) + "]";
    }
    out += " (";
    out += to_string(kind);
    out += ")";
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

TransportError TransportError::from_code(std::error_code code, std::string detail) {
    TransportError error;
    error.code = code;
    error.detail = std::move(detail);

    if (code.category() != transfer_errc_category()) {
        error.kind = ErrorClass::permanent;
        return error;
    }

    switch (static_cast<TransferErrc>(code.value())) {
        case TransferErrc::network_error:
        case TransferErrc::timeout:
        case TransferErrc::refused:
        case TransferErrc::dns_error:
        case TransferErrc::connection_lost:
        case TransferErrc::server_error:
            error.kind = ErrorClass::transient;
            break;
        case TransferErrc::rate_limited:
            error.kind = ErrorClass::rate_limited;
            break;
        default:
            error.kind = ErrorClass::permanent;
            break;
    }
    return error;
}

TransportError TransportError::from_status(std::int32_t status,
                                           std::chrono::milliseconds retry_after,
                                           std::string detail) {
    TransportError error;
    error.http_status = status;
    error.detail = std::move(detail);

    if (status == 429) {
        error.kind = ErrorClass::rate_limited;
        error.code = make_error_code(TransferErrc::rate_limited);
        error.retry_after = retry_after;
    } else if (status == 408) {
        error.kind = ErrorClass::transient;
        error.code = make_error_code(TransferErrc::timeout);
    } else if (status >= 500) {
        error.kind = ErrorClass::transient;
        error.code = make_error_code(TransferErrc::server_error);
        error.retry_after = retry_after;
    } else if (status == 401 || status == 403) {
        error.kind = ErrorClass::permanent;
        error.code = make_error_code(TransferErrc::unauthorized);
    } else if (status == 404) {
        error.kind = ErrorClass::permanent;
        error.code = make_error_code(TransferErrc::not_found);
    } else if (status >= 400) {
        error.kind = ErrorClass::permanent;
        error.code = make_error_code(TransferErrc::client_error);
    } else {
        // 1xx/3xx left over after redirects: nothing we can act on
        error.kind = ErrorClass::permanent;
        error.code = make_error_code(TransferErrc::malformed_response);
    }
    return error;
}

std::chrono::milliseconds parse_retry_after(std::string_view value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
    if (value.empty()) {
        return std::chrono::milliseconds::zero();
    }

    if (std::all_of(value.begin(), value.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        if (value.size() > 9) {
            return std::chrono::milliseconds::zero();
        }
        long long seconds = 0;
        for (char c : value) {
            seconds = seconds * 10 + (c - '0');
        }
        return std::chrono::seconds(seconds);
    }

    // IMF-fixdate: "Wed, 21 Oct 2015 07:28:00 GMT"
    try {
        std::tm tm{};
        std::istringstream in{std::string(value)};
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (in.fail()) {
            return std::chrono::milliseconds::zero();
        }
        std::time_t when = timegm(&tm);
        if (when == static_cast<std::time_t>(-1)) {
            return std::chrono::milliseconds::zero();
        }
        auto target = std::chrono::system_clock::from_time_t(when);
        auto now = std::chrono::system_clock::now();
        if (target <= now) {
            return std::chrono::milliseconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(target - now);
    } catch (const std::exception&) {
        return std::chrono::milliseconds::zero();
    }
}

//=============================================================================
// JobStatus
//=============================================================================

std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::queued:    return "queued";
        case JobStatus::running:   return "running";
        case JobStatus::succeeded: return "succeeded";
        case JobStatus::failed:    return "failed";
        case JobStatus::cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<JobStatus> parse_job_status(std::string_view text) noexcept {
    std::string lower;
    try {
        lower.reserve(text.size());
        for (char c : text) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    if (lower == "queued" || lower == "pending") return JobStatus::queued;
    if (lower == "running" || lower == "processing" || lower == "in_progress") return JobStatus::running;
    if (lower == "succeeded" || lower == "completed" || lower == "success") return JobStatus::succeeded;
    if (lower == "failed" || lower == "error") return JobStatus::failed;
    if (lower == "cancelled" || lower == "canceled") return JobStatus::cancelled;
    return std::nullopt;
}

} // namespace scribe::core
