#include "liveline/console/stream_interceptor.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/logger.hpp"
#include "liveline/common/text.hpp"

namespace liveline {
namespace console {

std::string CaptureBuffer::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string captured;
    captured.swap(data_);
    return captured;
}

CaptureBuffer::int_type CaptureBuffer::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    data_ += traits_type::to_char_type(ch);
    return ch;
}

std::streamsize CaptureBuffer::xsputn(const char* s, std::streamsize n) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.append(s, static_cast<size_t>(n));
    return n;
}

StreamInterceptor::StreamInterceptor(ConsoleSink& console,
                                     std::ostream& out,
                                     std::ostream& err,
                                     std::chrono::milliseconds relay_interval)
    : console_(console),
      out_(out),
      err_(err),
      relay_interval_(relay_interval) {
    if (relay_interval_.count() <= 0) {
        LIVELINE_THROW(common::InvalidArgument, "Relay interval must be positive, got {} ms", relay_interval_.count());
    }
}

StreamInterceptor::~StreamInterceptor() {
    try {
        deactivate();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Interceptor] Shutdown failed | error={}", e.what());
    }
}

void StreamInterceptor::activate() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (active_) {
        return;
    }
    
    original_out_ = out_.rdbuf(&out_buffer_);
    original_err_ = err_.rdbuf(&err_buffer_);
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    
    relay_thread_ = std::thread(&StreamInterceptor::relayLoop, this);
    active_ = true;
    
    common::Logger::instance().debug("[Interceptor] Activated | interval_ms={}", relay_interval_.count());
}

void StreamInterceptor::deactivate() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!active_) {
        return;
    }
    
    relayCaptured();
    console_.printLine("console {red}out!{endred}");
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    
    if (relay_thread_.joinable()) {
        relay_thread_.join();
    }
    
    out_.rdbuf(original_out_);
    err_.rdbuf(original_err_);
    original_out_ = nullptr;
    original_err_ = nullptr;
    
    relayCaptured();
    active_ = false;
    
    common::Logger::instance().debug("[Interceptor] Deactivated");
}

void StreamInterceptor::relayLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    
    while (!stop_requested_) {
        if (cv_.wait_for(lock, relay_interval_, [this] { return stop_requested_; })) {
            break;
        }
        
        lock.unlock();
        try {
            relayCaptured();
        } catch (const std::exception& e) {
            if (!fault_logged_) {
                fault_logged_ = true;
                common::Logger::instance().error("[Interceptor] Relay failed | error={}", e.what());
            }
        }
        lock.lock();
    }
}

void StreamInterceptor::relayCaptured() {
    std::string out = out_buffer_.drain();
    if (!common::isBlank(out)) {
        console_.relay(StreamOrigin::OUT, common::splitLines(out));
    }
    
    std::string err = err_buffer_.drain();
    if (!common::isBlank(err)) {
        console_.relay(StreamOrigin::ERR, common::splitLines(err));
    }
}

}}
