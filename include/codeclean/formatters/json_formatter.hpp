#pragma once

#include <string>

namespace codeclean {

// Parses JSON (// and /* */ comments tolerated and dropped) and re-emits it with
// two-space indentation and sorted object keys. Throws ParseError on malformed input.
// The result ends with a newline when the input did.
auto format_json(const std::string& text) -> std::string;

} // namespace codeclean
