#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind {
    NetworkFailure,        // 传输层或 HTTP 状态失败
    ProtocolError,         // 响应结构不符合预期
    AuthRequired,          // 没有可用凭据且不允许交互登录
    AuthDeclinedOrExpired, // 用户拒绝授权或设备码过期
    NotConnected,          // 流未连接时尝试发送
    PersistenceDegraded    // 缓存文件读写失败，仅内存可用
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NetworkFailure: return "NetworkFailure";
    case ErrorKind::ProtocolError: return "ProtocolError";
    case ErrorKind::AuthRequired: return "AuthRequired";
    case ErrorKind::AuthDeclinedOrExpired: return "AuthDeclinedOrExpired";
    case ErrorKind::NotConnected: return "NotConnected";
    case ErrorKind::PersistenceDegraded: return "PersistenceDegraded";
    }
    return "Unknown";
}

struct Error {
    ErrorKind   kind;
    std::string message;

    std::string describe() const { return std::string(toString(kind)) + ": " + message; }
};

// 组件之间统一的返回值：要么是值，要么是 Error，不跨边界抛异常
template <typename T> class Result {
public:
    Result(T value)
        : mValue(std::move(value)) {}
    Result(Error error)
        : mError(std::move(error)) {}

    bool ok() const { return mValue.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!mValue) throw std::logic_error("Result has no value: " + mError.describe());
        return *mValue;
    }
    T&& value() && {
        if (!mValue) throw std::logic_error("Result has no value: " + mError.describe());
        return std::move(*mValue);
    }

    const Error& error() const { return mError; }

private:
    std::optional<T> mValue;
    Error            mError{ErrorKind::ProtocolError, ""};
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error)
        : mError(std::move(error)) {}

    bool ok() const { return !mError.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *mError; }

private:
    std::optional<Error> mError;
};

using Status = Result<void>;
