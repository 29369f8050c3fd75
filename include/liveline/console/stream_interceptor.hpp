#pragma once

#include "console_sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>
#include <thread>

namespace liveline {
namespace console {

class CaptureBuffer : public std::streambuf {
public:
    std::string drain();

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* s, std::streamsize n) override;

private:
    std::mutex mutex_;
    std::string data_;
};

class StreamInterceptor {
public:
    StreamInterceptor(ConsoleSink& console,
                      std::ostream& out,
                      std::ostream& err,
                      std::chrono::milliseconds relay_interval = std::chrono::milliseconds(1000));
    ~StreamInterceptor();
    
    StreamInterceptor(const StreamInterceptor&) = delete;
    StreamInterceptor& operator=(const StreamInterceptor&) = delete;
    
    void activate();
    void deactivate();
    
    bool isActive() const { return active_.load(); }

private:
    ConsoleSink& console_;
    std::ostream& out_;
    std::ostream& err_;
    std::chrono::milliseconds relay_interval_;
    
    CaptureBuffer out_buffer_;
    CaptureBuffer err_buffer_;
    std::streambuf* original_out_ = nullptr;
    std::streambuf* original_err_ = nullptr;
    
    std::mutex lifecycle_mutex_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> active_{false};
    std::thread relay_thread_;
    bool fault_logged_ = false;
    
    void relayLoop();
    void relayCaptured();
};

}}
