#include "liveline/console/console_sink.hpp"
#include "liveline/console/color.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/logger.hpp"
#include "liveline/common/text.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace liveline {
namespace console {

namespace {

constexpr const char* MESSAGE_GLYPH = "◆";
constexpr const char* RIGHT_POINTER = "»";
constexpr const char* CARRIAGE_RETURN = "\r\033[K";

std::string collapseLines(const std::string& text) {
    auto lines = common::splitLines(text);
    std::string result;
    for (const auto& line : lines) {
        if (!result.empty()) {
            result += ' ';
        }
        result += line;
    }
    return result;
}

}

ConsoleSink::ConsoleSink(std::string title, std::ostream& terminal, ConsoleOptions options)
    : terminal_(terminal.rdbuf()),
      title_(std::move(title)),
      text_color_(options.text_color),
      unicode_supported_(options.unicode_supported) {
    colorFromName(text_color_);
}

std::string ConsoleSink::title() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return title_;
}

void ConsoleSink::setTitle(const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    title_ = title;
}

void ConsoleSink::setTextColor(const std::string& color) {
    colorFromName(color);
    std::lock_guard<std::mutex> lock(mutex_);
    text_color_ = color;
}

std::string ConsoleSink::parse(const std::string& text,
                               const std::optional<std::string>& title,
                               const std::string& color) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parseLocked(text, title, color);
}

std::string ConsoleSink::parseLocked(const std::string& text,
                                     const std::optional<std::string>& title,
                                     const std::string& color) const {
    std::string prefix = fmt::format("{}{}{} {} {}{}{}",
                                     colorCode(Color::RED), MESSAGE_GLYPH,
                                     colorCode(Color::BLUE), title.value_or(title_),
                                     colorCode(Color::CYAN), RIGHT_POINTER,
                                     colorCode(Color::DEFAULT));
    std::string body = format(collapseLines(text), color.empty() ? text_color_ : color);
    return prefix + " " + body;
}

void ConsoleSink::printLine(const std::string& text,
                            const std::optional<std::string>& title,
                            const std::string& color) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string message = parseLocked(text, title, color);
    
    if (!last_line_.empty()) {
        message = "\n" + message;
    }
    writeLocked(message + "\n");
    last_line_.clear();
}

void ConsoleSink::replaceLastLine(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string message = parseLocked(text, std::nullopt, "");
    writeLocked(CARRIAGE_RETURN + message);
    last_line_ = unicode_supported_ ? message : common::replaceNonBmp(message);
}

void ConsoleSink::logError(const std::string& text) {
    printLine("Error: " + text, std::nullopt, "red");
}

void ConsoleSink::relay(StreamOrigin origin, const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string title = origin == StreamOrigin::OUT ? "Sys[out]" : "Sys[err]";
    std::string color = origin == StreamOrigin::OUT ? "" : "red";
    
    std::string block = CARRIAGE_RETURN;
    for (const auto& line : lines) {
        block += parseLocked(line, title, color);
        block += '\n';
    }
    block += last_line_;
    
    writeLocked(block);
}

void ConsoleSink::write(const std::string& raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    writeLocked(raw);
}

std::string ConsoleSink::lastLine() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_line_;
}

bool ConsoleSink::unicodeSupported() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unicode_supported_;
}

void ConsoleSink::writeLocked(const std::string& raw) {
    const std::string text = unicode_supported_ ? raw : common::replaceNonBmp(raw);
    
    std::streambuf* buffer = terminal_.rdbuf();
    if (buffer == nullptr) {
        return;
    }
    
    auto accepted = static_cast<size_t>(std::max<std::streamsize>(
        buffer->sputn(text.data(), static_cast<std::streamsize>(text.size())), 0));
    if (accepted == text.size()) {
        terminal_.flush();
        terminal_.clear();
        return;
    }
    
    if (unicode_supported_) {
        unicode_supported_ = false;
        common::Logger::instance().warn("[Console] Falling back to basic plane characters | code={} | title={}",
                                        common::ErrorCodeHelper::toString(common::ErrorCode::UNSUPPORTED_ENCODING),
                                        title_);
        
        std::string remainder = common::replaceNonBmp(text.substr(accepted));
        auto resumed = buffer->sputn(remainder.data(), static_cast<std::streamsize>(remainder.size()));
        if (resumed == static_cast<std::streamsize>(remainder.size())) {
            terminal_.flush();
            terminal_.clear();
            return;
        }
    }
    
    terminal_.clear();
    if (!encoding_fault_logged_) {
        encoding_fault_logged_ = true;
        common::Logger::instance().error("[Console] Terminal write failed | code={} | title={}",
                                         common::ErrorCodeHelper::toString(common::ErrorCode::UNSUPPORTED_ENCODING),
                                         title_);
    }
}

}}
