#include "knowledge/errors.hpp"

#include <utility>

namespace kbindexer {

SqliteExtensionUnavailableError::SqliteExtensionUnavailableError(std::string extension_name)
    : KnowledgeError("SQLite extension '" + extension_name + "' is not available"),
      extension_name_(std::move(extension_name)) {}

SqliteExtensionUnavailableError::SqliteExtensionUnavailableError(std::string extension_name,
                                                                 const std::string& message)
    : KnowledgeError(message), extension_name_(std::move(extension_name)) {}

std::string describe_cause(const std::exception_ptr& cause) {
    if (!cause) {
        return {};
    }
    try {
        std::rethrow_exception(cause);
    } catch (const KnowledgeIndexError& ex) {
        const auto inner = describe_cause(ex.cause());
        return inner.empty() ? ex.what() : inner;
    } catch (const std::exception& ex) {
        return ex.what();
    }
}

}  // namespace kbindexer
