#pragma once

#include <functional>
#include <mutex>
#include <string>

#include "xblchat_export.hpp"

/**
 * @brief 日志级别枚举
 *
 * 定义了不同的日志级别，用于区分日志的重要程度
 */
enum class LogLevel {
    Debug    = 0, // 调试信息
    Info     = 1, // 信息
    Warning  = 2, // 警告
    Error    = 3, // 错误
    Critical = 4  // 严重错误
};

using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

inline const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * 进程级日志入口。未设置回调时所有日志被丢弃，库的调用方决定输出到哪里。
 * 流客户端的后台线程也会写日志，回调可能被多个线程同时调用，需要自己保证线程安全。
 */
class XBLCHAT_API Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // 设置日志回调函数
    void setLogCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mMutex);
        mLogCallback = std::move(callback);
    }

    // 清除日志回调函数
    void clearLogCallback() {
        std::lock_guard<std::mutex> lock(mMutex);
        mLogCallback = nullptr;
    }

    void setMinimumLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mMutex);
        mMinimumLevel = level;
    }

    // 记录日志消息；回调在锁外执行，回调内部再写日志不会死锁
    void log(LogLevel level, const std::string& message) {
        LogCallback callback;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (!mLogCallback || level < mMinimumLevel) {
                return;
            }
            callback = mLogCallback;
        }
        callback(level, message);
    }

    // 便利方法
    void debug(const std::string& message) { log(LogLevel::Debug, message); }

    void info(const std::string& message) { log(LogLevel::Info, message); }

    void warning(const std::string& message) { log(LogLevel::Warning, message); }

    void error(const std::string& message) { log(LogLevel::Error, message); }

    void critical(const std::string& message) { log(LogLevel::Critical, message); }

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex  mMutex;
    LogCallback mLogCallback  = nullptr;
    LogLevel    mMinimumLevel = LogLevel::Info;
};

// 便利宏定义
#define LOG_DEBUG(msg) Logger::getInstance().debug(msg)
#define LOG_INFO(msg) Logger::getInstance().info(msg)
#define LOG_WARNING(msg) Logger::getInstance().warning(msg)
#define LOG_ERROR(msg) Logger::getInstance().error(msg)
#define LOG_CRITICAL(msg) Logger::getInstance().critical(msg)
