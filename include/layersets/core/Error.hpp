#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidParameter,
        MalformedInput,
        ValidationFailed,
        CapacityExceeded,
        RateLimited,
        StorageFailure,
        Timeout,
        NotFound,
        Conflict,
        InvalidPermissions
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::vector<std::string> d)
        : code(c), message(std::move(m)), details(std::move(d)) {}

    Code                       code;
    std::optional<std::string> message;
    std::vector<std::string>   details;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidParameter:
        return "parameter_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::ValidationFailed:
        return "validation_error";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    case Error::Code::RateLimited:
        return "rate_limited";
    case Error::Code::StorageFailure:
        return "storage_error";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::Conflict:
        return "conflict";
    case Error::Code::InvalidPermissions:
        return "permission_denied";
    }
    return "unknown_error";
}

// Storage errors leave no partial state behind, so the same request may be resubmitted.
[[nodiscard]] inline auto isRetryableAsIs(Error::Code code) -> bool {
    return code == Error::Code::StorageFailure || code == Error::Code::Timeout;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    std::string description{label};
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    for (auto const& detail : error.details) {
        description.append("; ");
        description.append(detail);
    }
    return description;
}

} // namespace LS
