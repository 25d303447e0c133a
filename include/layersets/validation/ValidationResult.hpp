#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace LS {

struct ValidationIssue {
    std::string                message;
    std::optional<std::string> field;

    bool operator==(ValidationIssue const&) const = default;
};

/*
 * Outcome of validating untrusted input: the sanitized value plus the errors that make it
 * unusable and the warnings about data that was adjusted or dropped along the way.
 */
template <typename T>
class ValidationResult {
public:
    ValidationResult() = default;

    [[nodiscard]] static auto success(T data, std::vector<ValidationIssue> warnings = {}) -> ValidationResult {
        ValidationResult result;
        result.data_     = std::move(data);
        result.warnings_ = std::move(warnings);
        return result;
    }

    [[nodiscard]] static auto failure(std::vector<ValidationIssue> errors,
                                      std::vector<ValidationIssue> warnings = {}) -> ValidationResult {
        ValidationResult result;
        result.valid_    = false;
        result.errors_   = std::move(errors);
        result.warnings_ = std::move(warnings);
        return result;
    }

    [[nodiscard]] auto isValid() const -> bool { return valid_; }
    [[nodiscard]] auto data() const -> T const& { return data_; }
    [[nodiscard]] auto data() -> T& { return data_; }
    [[nodiscard]] auto takeData() -> T { return std::move(data_); }
    auto setData(T data) -> void { data_ = std::move(data); }

    [[nodiscard]] auto errors() const -> std::vector<ValidationIssue> const& { return errors_; }
    [[nodiscard]] auto warnings() const -> std::vector<ValidationIssue> const& { return warnings_; }
    [[nodiscard]] auto metadata() const -> nlohmann::json const& { return metadata_; }

    auto addError(std::string message, std::optional<std::string> field = std::nullopt) -> void {
        valid_ = false;
        errors_.push_back(ValidationIssue{std::move(message), std::move(field)});
    }

    auto addWarning(std::string message, std::optional<std::string> field = std::nullopt) -> void {
        warnings_.push_back(ValidationIssue{std::move(message), std::move(field)});
    }

    auto setMetadata(std::string const& key, nlohmann::json value) -> void {
        metadata_[key] = std::move(value);
    }

    [[nodiscard]] auto errorMessages() const -> std::vector<std::string> { return messagesOf(errors_); }
    [[nodiscard]] auto warningMessages() const -> std::vector<std::string> { return messagesOf(warnings_); }

    // Validity is the conjunction of both results; data stays with this result.
    template <typename U>
    auto merge(ValidationResult<U> const& other) -> void {
        valid_ = valid_ && other.isValid();
        errors_.insert(errors_.end(), other.errors().begin(), other.errors().end());
        warnings_.insert(warnings_.end(), other.warnings().begin(), other.warnings().end());
        if (other.metadata().is_object()) {
            for (auto const& [key, value] : other.metadata().items()) {
                metadata_[key] = value;
            }
        }
    }

private:
    static auto messagesOf(std::vector<ValidationIssue> const& issues) -> std::vector<std::string> {
        std::vector<std::string> messages;
        messages.reserve(issues.size());
        for (auto const& issue : issues) {
            messages.push_back(issue.message);
        }
        return messages;
    }

    bool                         valid_{true};
    T                            data_{};
    std::vector<ValidationIssue> errors_;
    std::vector<ValidationIssue> warnings_;
    nlohmann::json               metadata_ = nlohmann::json::object();
};

} // namespace LS
