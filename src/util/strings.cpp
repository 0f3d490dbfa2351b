#include "util/strings.hpp"

#include <algorithm>
#include <cctype>

namespace uc::util {

std::vector<std::string> split(const std::string_view s, const char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        const auto pos = s.find(sep, start);
        const auto end = pos == std::string_view::npos ? s.size() : pos;
        if (end > start) out.emplace_back(s.substr(start, end - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

std::string trim(const std::string_view s) {
    const auto isSpace = [](const unsigned char c) { return std::isspace(c) != 0; };
    size_t b = 0, e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return std::string{s.substr(b, e - b)};
}

std::string toLower(const std::string_view s) {
    std::string out{s};
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string joinPath(const std::string_view base, const std::string_view leaf) {
    if (base.empty()) return std::string{leaf};
    if (leaf.empty()) return std::string{base};
    std::string out{base};
    if (out.back() != '/') out += '/';
    out += leaf;
    return out;
}

std::string stripSeparators(const std::string_view s) {
    const auto isSep = [](const char c) { return c == '/' || c == '\\'; };
    size_t b = 0, e = s.size();
    while (b < e && isSep(s[b])) ++b;
    while (e > b && isSep(s[e - 1])) --e;
    return std::string{s.substr(b, e - b)};
}

}
