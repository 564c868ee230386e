#include "utils/string_utils.h"

#include <cstring>

namespace statlas {
namespace utils {

std::string escapeRegex(const std::string& text) {
    static const char* kMeta = "\\.+*?()|[]{}^$";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && std::strchr(kMeta, c) != nullptr) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> splitNonEmptyLines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& line : split(text, "\n")) {
        std::string t = trim(line);
        if (!t.empty()) lines.push_back(std::move(t));
    }
    return lines;
}

std::vector<std::string> split(const std::string& text, const std::string& sep) {
    std::vector<std::string> parts;
    if (sep.empty()) {
        parts.push_back(text);
        return parts;
    }
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + sep.size();
    }
    return parts;
}

} // namespace utils
} // namespace statlas
