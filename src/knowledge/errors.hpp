#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace kbindexer {

// Root of every error raised by the knowledge indexing layer.
class KnowledgeError : public std::runtime_error {
public:
    explicit KnowledgeError(const std::string& message) : std::runtime_error(message) {}
};

// Knowledge features were switched off by configuration.
class KnowledgeDisabledError : public KnowledgeError {
public:
    KnowledgeDisabledError() : KnowledgeError("Knowledge functionality is disabled") {}
    explicit KnowledgeDisabledError(const std::string& message) : KnowledgeError(message) {}
};

// A storage extension the backend depends on could not be loaded.
class SqliteExtensionUnavailableError : public KnowledgeError {
public:
    explicit SqliteExtensionUnavailableError(std::string extension_name);
    SqliteExtensionUnavailableError(std::string extension_name, const std::string& message);

    const std::string& extension_name() const noexcept { return extension_name_; }

private:
    std::string extension_name_;
};

// Indexing failed. `cause` keeps the collaborator's original exception, if any.
class KnowledgeIndexError : public KnowledgeError {
public:
    explicit KnowledgeIndexError(const std::string& message, std::exception_ptr cause = nullptr)
        : KnowledgeError(message), cause_(std::move(cause)) {}

    const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

class KnowledgeSearchError : public KnowledgeError {
public:
    explicit KnowledgeSearchError(const std::string& message, std::exception_ptr cause = nullptr)
        : KnowledgeError(message), cause_(std::move(cause)) {}

    const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

// Invalid configuration or input. `field` and `value` name the offending setting.
class KnowledgeValidationError : public KnowledgeError {
public:
    explicit KnowledgeValidationError(const std::string& message,
                                      std::optional<std::string> field = std::nullopt,
                                      std::optional<std::string> value = std::nullopt)
        : KnowledgeError(message), field_(std::move(field)), value_(std::move(value)) {}

    const std::optional<std::string>& field() const noexcept { return field_; }
    const std::optional<std::string>& value() const noexcept { return value_; }

private:
    std::optional<std::string> field_;
    std::optional<std::string> value_;
};

// Message of the innermost exception held by `cause`, or an empty string.
// Causes are always captured from std::exception handlers.
std::string describe_cause(const std::exception_ptr& cause);

}  // namespace kbindexer
