#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "chat/beast_relay_connection.hpp"
#include "chat/relay_connection.hpp"
#include "config/app_config.hpp"
#include "utils/result.hpp"
#include "xblchat_export.hpp"

enum class StreamState { Disconnected, Connecting, Connected, Closing };

XBLCHAT_API const char* toString(StreamState state);

using ChatHandler       = std::function<void(const std::string& sender, const std::string& message)>;
using ConnectionHandler = std::function<void(bool connected)>;
using ReconnectHandler  = std::function<void(int attempt, std::chrono::milliseconds delay)>;

/**
 * 到本地聊天中继的长连接，断线后按线性退避重连（base_delay * attempt），
 * 超过 max_attempts 后彻底放弃，直到再次调用 connect()。
 *
 * 所有回调都在连接的 io 线程或重连线程上执行，且不持有客户端的锁，
 * 回调中可以调用 send()、connect() 和 disconnect()，但不能长时间阻塞，否则会拖慢后续帧和断线检测。
 */
class XBLCHAT_API ChatStreamClient {
public:
    explicit ChatStreamClient(const RelayConfig& config, RelayConnectionFactory factory = makeBeastRelayConnection);
    ~ChatStreamClient();

    ChatStreamClient(const ChatStreamClient&)            = delete;
    ChatStreamClient& operator=(const ChatStreamClient&) = delete;

    // 启动连接循环，最多等待 grace 时间判断首次连接是否立即失败；返回当前是否已连接。
    // 在回调中调用时不等待：连接循环收尾后直接开始新一轮，返回 false
    bool connect(bool auto_reconnect = true);
    void disconnect();

    // 未连接时返回 NotConnected，不做任何缓冲
    Status send(const std::string& message, const std::optional<std::string>& target = std::nullopt);

    void setChatHandler(ChatHandler handler);
    // 注册时若已连接，会立即同步回调一次 true
    void setConnectionHandler(ConnectionHandler handler);
    void setReconnectHandler(ReconnectHandler handler);

    StreamState state() const;
    bool        isConnected() const { return state() == StreamState::Connected; }

private:
    void run();
    void handleOpen(uint64_t generation);
    void handleMessage(uint64_t generation, const std::string& frame);
    void handleClose(uint64_t generation, const std::string& reason);

private:
    RelayConfig            mConfig;
    RelayConnectionFactory mFactory;

    mutable std::mutex      mMutex;
    std::condition_variable mWake;

    StreamState mState             = StreamState::Disconnected;
    bool        mShouldRun         = false;
    bool        mAutoReconnect     = true;
    int         mAttempts          = 0;
    uint64_t    mGeneration        = 0;
    bool        mAttemptEnded      = false;
    bool        mWasOpen           = false; // 当前连接已经回调过 true，还欠一次 false
    bool        mFirstAttemptDone  = false;
    bool        mWorkerRunning     = false; // run() 尚未返回
    bool        mRestart           = false; // 回调里请求了新一轮 connect，由 run() 接手
    bool        mDestroying        = false;
    uint64_t    mSession           = 0;     // 每次 connect() 开始新一轮时递增

    std::unique_ptr<RelayConnection> mConnection;
    std::thread                      mWorker;

    ChatHandler       mChatHandler;
    ConnectionHandler mConnectionHandler;
    ReconnectHandler  mReconnectHandler;
};
