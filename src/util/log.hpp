#pragma once

#include <string_view>

namespace kbindexer::log {

enum class Level { Info, Warn, Error };

// Minimum level is read once from KBINDEX_LOG_LEVEL ("info", "warn", "error").
Level threshold();

void write(Level level, std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace kbindexer::log
