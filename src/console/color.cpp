#include "liveline/console/color.hpp"
#include "liveline/common/errors.hpp"
#include <array>
#include <mutex>
#include <random>
#include <sstream>

namespace liveline {
namespace console {

namespace {

constexpr std::array<const char*, 9> CODES = {
    "\033[30m",
    "\033[31m",
    "\033[32m",
    "\033[33m",
    "\033[34m",
    "\033[35m",
    "\033[36m",
    "\033[37m",
    "\033[0m"
};

size_t randomIndex(size_t bound) {
    static std::mutex mutex;
    static std::mt19937 engine{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mutex);
    return std::uniform_int_distribution<size_t>(0, bound - 1)(engine);
}

}

const std::vector<std::string>& colorNames() {
    static const std::vector<std::string> names = {
        "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white", "default"
    };
    return names;
}

bool isColorName(const std::string& name) {
    for (const auto& known : colorNames()) {
        if (known == name) {
            return true;
        }
    }
    return false;
}

Color colorFromName(const std::string& name) {
    const auto& names = colorNames();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return static_cast<Color>(i);
        }
    }
    LIVELINE_THROW(common::InvalidArgument,
                   "Color '{}' not found. Choose one of black, red, green, yellow, blue, "
                   "magenta, cyan, white, default", name);
}

const char* colorCode(Color color) {
    return CODES[static_cast<size_t>(color)];
}

std::string colorCode(const std::string& name) {
    return colorCode(colorFromName(name));
}

std::string templateFormat(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        if (open == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        
        size_t close = text.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        
        result.append(text, pos, open - pos);
        
        std::string name = text.substr(open + 1, close - open - 1);
        if (isColorName(name)) {
            result += colorCode(colorFromName(name));
        } else if (name.size() > 3 && name.compare(0, 3, "end") == 0 && isColorName(name.substr(3))) {
            result += colorCode(Color::DEFAULT);
        } else {
            result.append(text, open, close - open + 1);
        }
        
        pos = close + 1;
    }
    
    return result;
}

std::string format(const std::string& text, const std::string& color) {
    if (color == RANDOM_COLOR) {
        return randomColor(text);
    }
    
    const char* code = colorCode(colorFromName(color));
    return code + templateFormat(text) + colorCode(Color::DEFAULT);
}

std::string randomColor(const std::string& text) {
    const auto& names = colorNames();
    return format(text, names[randomIndex(names.size())]);
}

std::string colorfulWords(const std::string& text) {
    std::istringstream words(text);
    std::string word;
    std::string result;
    
    while (words >> word) {
        if (!result.empty()) {
            result += ' ';
        }
        result += randomColor(word);
    }
    
    return result;
}

}}
