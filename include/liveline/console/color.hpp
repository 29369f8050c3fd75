#pragma once

#include <string>
#include <vector>

namespace liveline {
namespace console {

enum class Color {
    BLACK,
    RED,
    GREEN,
    YELLOW,
    BLUE,
    MAGENTA,
    CYAN,
    WHITE,
    DEFAULT
};

constexpr const char* RANDOM_COLOR = "random";

const std::vector<std::string>& colorNames();

bool isColorName(const std::string& name);

Color colorFromName(const std::string& name);

const char* colorCode(Color color);

std::string colorCode(const std::string& name);

std::string templateFormat(const std::string& text);

std::string format(const std::string& text, const std::string& color);

std::string randomColor(const std::string& text);

std::string colorfulWords(const std::string& text);

}}
