#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace liveline {
namespace console {

struct ConsoleOptions {
    std::string text_color = "default";
    bool unicode_supported = true;
};

enum class StreamOrigin {
    OUT,
    ERR
};

class ConsoleSink {
public:
    ConsoleSink(std::string title, std::ostream& terminal, ConsoleOptions options = {});
    
    ConsoleSink(const ConsoleSink&) = delete;
    ConsoleSink& operator=(const ConsoleSink&) = delete;
    
    std::string title() const;
    void setTitle(const std::string& title);
    
    void setTextColor(const std::string& color);
    
    std::string parse(const std::string& text,
                      const std::optional<std::string>& title = std::nullopt,
                      const std::string& color = "") const;
    
    void printLine(const std::string& text,
                   const std::optional<std::string>& title = std::nullopt,
                   const std::string& color = "");
    void replaceLastLine(const std::string& text);
    void logError(const std::string& text);
    
    void relay(StreamOrigin origin, const std::vector<std::string>& lines);
    
    void write(const std::string& raw);
    
    std::string lastLine() const;
    bool unicodeSupported() const;

private:
    mutable std::mutex mutex_;
    std::ostream terminal_;
    std::string title_;
    std::string text_color_;
    bool unicode_supported_;
    std::string last_line_;
    bool encoding_fault_logged_ = false;
    
    std::string parseLocked(const std::string& text,
                            const std::optional<std::string>& title,
                            const std::string& color) const;
    void writeLocked(const std::string& raw);
};

}}
