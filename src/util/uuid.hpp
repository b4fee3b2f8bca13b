#pragma once

#include <string>

namespace kbindexer::uuid {

// Random (version 4) UUID in canonical 8-4-4-4-12 form, lower-case.
std::string generate();

}  // namespace kbindexer::uuid
