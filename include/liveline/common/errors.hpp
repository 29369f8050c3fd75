#pragma once

#include "error_framework.hpp"
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace liveline {
namespace common {

enum class ErrorCode {
    INVALID_ARGUMENT = 100,
    UNSUPPORTED_ENCODING = 200,
    RUNTIME_FAULT = 300,
    DEPRECATED = 400
};

using ErrorCodeHelper = ErrorRegistry<ErrorCode>;

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message, SourceContext where = {});

    ErrorCode code() const { return code_; }
    const SourceContext& where() const { return where_; }

private:
    ErrorCode code_;
    SourceContext where_;
};

class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& message, SourceContext where = {})
        : Error(ErrorCode::INVALID_ARGUMENT, message, where) {}
};

class DeprecationNotice : public Error {
public:
    explicit DeprecationNotice(const std::string& message, SourceContext where = {})
        : Error(ErrorCode::DEPRECATED, message, where) {}
};

template<>
inline const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>>&
ErrorRegistry<ErrorCode>::getInfoMap() {
    static const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>> map = {
        {ErrorCode::INVALID_ARGUMENT, {
            ErrorCode::INVALID_ARGUMENT,
            "INVALID_ARGUMENT",
            "Invalid argument"
        }},
        {ErrorCode::UNSUPPORTED_ENCODING, {
            ErrorCode::UNSUPPORTED_ENCODING,
            "UNSUPPORTED_ENCODING",
            "Terminal cannot render text"
        }},
        {ErrorCode::RUNTIME_FAULT, {
            ErrorCode::RUNTIME_FAULT,
            "RUNTIME_FAULT",
            "Runtime fault"
        }},
        {ErrorCode::DEPRECATED, {
            ErrorCode::DEPRECATED,
            "DEPRECATED",
            "Deprecated usage"
        }}
    };
    return map;
}

}}

#define LIVELINE_HERE ::liveline::common::SourceContext{__FILE__, __LINE__}

#define LIVELINE_THROW(Type, ...) \
    throw Type(fmt::format(__VA_ARGS__), LIVELINE_HERE)
