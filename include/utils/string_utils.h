#pragma once

#include <string>
#include <vector>

namespace statlas {
namespace utils {

/// Escape every regex metacharacter so the text matches itself literally
std::string escapeRegex(const std::string& text);

/// Strip leading/trailing whitespace (space, tab, CR, LF)
std::string trim(const std::string& s);

/// Split on '\n', trim each line and drop the empty ones
std::vector<std::string> splitNonEmptyLines(const std::string& text);

/// Split on a separator string; empty parts are kept
std::vector<std::string> split(const std::string& text, const std::string& sep);

} // namespace utils
} // namespace statlas
