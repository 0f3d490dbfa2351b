#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace uc::util {

// Splits on sep, dropping empty segments ("a//b/" -> {"a", "b"})
std::vector<std::string> split(std::string_view s, char sep = '/');

std::string trim(std::string_view s);

std::string toLower(std::string_view s);

// Joins two '/'-separated relative paths, tolerating empty sides
std::string joinPath(std::string_view base, std::string_view leaf);

// Removes every leading and trailing '/' (and '\\')
std::string stripSeparators(std::string_view s);

}
