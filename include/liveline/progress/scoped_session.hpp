#pragma once

#include "progress_session.hpp"

namespace liveline {
namespace progress {

class ScopedSession {
public:
    explicit ScopedSession(ProgressSession& session);
    ~ScopedSession();
    
    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;
    
    ProgressSession& session() { return session_; }

private:
    ProgressSession& session_;
};

}}
