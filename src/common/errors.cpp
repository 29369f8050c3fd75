#include "liveline/common/errors.hpp"
#include "liveline/common/text.hpp"

namespace liveline {
namespace common {

Error::Error(ErrorCode code, const std::string& message, SourceContext where)
    : std::runtime_error(message),
      code_(code),
      where_(where) {}

std::string formatContext(const SourceContext& ctx) {
    if (ctx.empty()) {
        return "";
    }
    return fmt::format("{}:{}", baseName(ctx.file), ctx.line);
}

}}
