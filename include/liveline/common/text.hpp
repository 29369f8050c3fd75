#pragma once

#include <string>
#include <vector>

namespace liveline {
namespace common {

std::string encodeUtf8(char32_t codepoint);

std::string replaceNonBmp(const std::string& text);

std::string formatClock(double seconds);

std::vector<std::string> splitLines(const std::string& text);

bool isBlank(const std::string& text);

std::string baseName(const std::string& path);

}}
