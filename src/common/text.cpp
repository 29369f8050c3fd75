#include "liveline/common/text.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace liveline {
namespace common {

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";
constexpr double MAX_CLOCK_SECONDS = 1e12;

size_t sequenceLength(unsigned char lead) {
    if ((lead & 0x80) == 0x00) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

}

std::string encodeUtf8(char32_t codepoint) {
    std::string out;
    auto cp = static_cast<uint32_t>(codepoint);
    
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += REPLACEMENT_CHARACTER;
    }
    
    return out;
}

std::string replaceNonBmp(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = sequenceLength(c);
        
        if (len == 1) {
            result += text[i];
            continue;
        }
        
        bool valid = len > 0 && i + len <= text.size();
        for (size_t j = 1; valid && j < len; ++j) {
            if ((static_cast<unsigned char>(text[i + j]) & 0xC0) != 0x80) {
                valid = false;
            }
        }
        
        if (!valid) {
            result += REPLACEMENT_CHARACTER;
            continue;
        }
        
        if (len == 4) {
            result += REPLACEMENT_CHARACTER;
        } else {
            result.append(text, i, len);
        }
        i += len - 1;
    }
    
    return result;
}

std::string formatClock(double seconds) {
    if (!(seconds > 0)) {
        seconds = 0;
    }
    if (!std::isfinite(seconds) || seconds > MAX_CLOCK_SECONDS) {
        seconds = MAX_CLOCK_SECONDS;
    }
    auto total = static_cast<uint64_t>(std::floor(seconds));
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }
    
    if (!current.empty()) {
        lines.push_back(current);
    }
    
    return lines;
}

bool isBlank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string baseName(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

}}
