#include "liveline/progress/scoped_session.hpp"
#include "liveline/common/logger.hpp"
#include <exception>

namespace liveline {
namespace progress {

ScopedSession::ScopedSession(ProgressSession& session)
    : session_(session) {
    session_.start();
}

ScopedSession::~ScopedSession() {
    try {
        session_.stop();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Scope exit failed | error={}", e.what());
    }
}

}}
