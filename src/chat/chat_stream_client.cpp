#include "chat_stream_client.hpp"

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

// 当前线程是否正在执行客户端回调；回调里调用 disconnect() 时不能 join 重连线程
static thread_local int tCallbackDepth = 0;

namespace {
struct CallbackScope {
    CallbackScope() { ++tCallbackDepth; }
    ~CallbackScope() { --tCallbackDepth; }
};
} // namespace

const char* toString(StreamState state) {
    switch (state) {
    case StreamState::Disconnected: return "Disconnected";
    case StreamState::Connecting: return "Connecting";
    case StreamState::Connected: return "Connected";
    case StreamState::Closing: return "Closing";
    }
    return "Unknown";
}

ChatStreamClient::ChatStreamClient(const RelayConfig& config, RelayConnectionFactory factory)
    : mConfig(config),
      mFactory(std::move(factory)) {}

ChatStreamClient::~ChatStreamClient() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mDestroying = true;
    }
    disconnect();
    if (mWorker.joinable()) {
        mWorker.join();
    }
}

bool ChatStreamClient::connect(bool auto_reconnect) {
    std::unique_lock<std::mutex> lock(mMutex);
    if (mDestroying) {
        return false;
    }
    mAutoReconnect = auto_reconnect;
    mAttempts      = 0;
    if (mShouldRun) {
        return mState == StreamState::Connected;
    }

    // 连接循环还没退出，而当前线程就是它或者它正在等待的 io 线程：不能 join，交给 run() 重新开始
    bool inside_loop = tCallbackDepth > 0 || mWorker.get_id() == std::this_thread::get_id();
    if (mWorkerRunning && inside_loop) {
        mShouldRun        = true;
        mRestart          = true;
        mFirstAttemptDone = false;
        ++mSession;
        mWake.notify_all();
        LOG_DEBUG("Reconnect requested from a callback, restarting the connection loop");
        return false;
    }
    lock.unlock();

    // 上一轮已经放弃或被 disconnect，等它收尾
    if (mWorker.joinable()) {
        mWorker.join();
    }

    lock.lock();
    mShouldRun        = true;
    mRestart          = false;
    mFirstAttemptDone = false;
    mWorkerRunning    = true;
    mState            = StreamState::Connecting;
    ++mSession;
    mWorker = std::thread(&ChatStreamClient::run, this);

    mWake.wait_for(lock, std::chrono::milliseconds(mConfig.grace_ms), [this] { return mFirstAttemptDone || !mShouldRun; });
    return mState == StreamState::Connected;
}

void ChatStreamClient::disconnect() {
    std::unique_lock<std::mutex> lock(mMutex);
    if (!mShouldRun) {
        return;
    }
    mShouldRun = false;
    mRestart   = false;
    mWake.notify_all();
    uint64_t session = mSession;
    lock.unlock();

    LOG_INFO("Disconnecting from chat relay");

    if (tCallbackDepth > 0 || !mWorker.joinable() || mWorker.get_id() == std::this_thread::get_id()) {
        return;
    }

    // 断开时的 false 回调可能重新 connect()，那样连接循环会继续运行，不能 join
    lock.lock();
    mWake.wait(lock, [&] { return !mWorkerRunning || mSession != session; });
    bool finished = !mWorkerRunning;
    lock.unlock();
    if (finished) {
        mWorker.join();
    }
}

Status ChatStreamClient::send(const std::string& message, const std::optional<std::string>& target) {
    nlohmann::json payload = {{"type", "chat_message"}, {"message", message}};
    if (target && !target->empty()) {
        payload["target"] = *target;
    }

    std::lock_guard<std::mutex> lock(mMutex);
    if (mState != StreamState::Connected || !mConnection) {
        return Error{ErrorKind::NotConnected, "not connected to chat server"};
    }
    if (!mConnection->send(payload.dump())) {
        return Error{ErrorKind::NotConnected, "connection to chat server is closing"};
    }
    return {};
}

void ChatStreamClient::setChatHandler(ChatHandler handler) {
    std::lock_guard<std::mutex> lock(mMutex);
    mChatHandler = std::move(handler);
}

void ChatStreamClient::setConnectionHandler(ConnectionHandler handler) {
    bool connected = false;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mConnectionHandler = handler;
        connected          = mState == StreamState::Connected;
    }
    if (connected && handler) {
        CallbackScope scope;
        handler(true);
    }
}

void ChatStreamClient::setReconnectHandler(ReconnectHandler handler) {
    std::lock_guard<std::mutex> lock(mMutex);
    mReconnectHandler = std::move(handler);
}

StreamState ChatStreamClient::state() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mState;
}

void ChatStreamClient::run() {
    std::unique_lock<std::mutex> lock(mMutex);
    while (mShouldRun) {
        mRestart            = false;
        uint64_t generation = ++mGeneration;
        mState              = StreamState::Connecting;
        mAttemptEnded       = false;
        mWasOpen            = false;
        lock.unlock();

        auto connection        = mFactory(mConfig.url);
        connection->on_open    = [this, generation] { handleOpen(generation); };
        connection->on_message = [this, generation](const std::string& frame) { handleMessage(generation, frame); };
        connection->on_close   = [this, generation](const std::string& reason) { handleClose(generation, reason); };
        RelayConnection* active = connection.get();

        lock.lock();
        mConnection = std::move(connection);
        lock.unlock();

        active->start();

        lock.lock();
        mWake.wait(lock, [this] { return mAttemptEnded || !mShouldRun || mRestart; });

        // 之后到达的事件都属于旧连接，按代号丢弃
        ++mGeneration;
        bool owes_close = mWasOpen;
        mWasOpen        = false;
        if (mState == StreamState::Connected) {
            mState = StreamState::Closing;
        }
        auto finished           = std::move(mConnection);
        auto connection_handler = mConnectionHandler;
        lock.unlock();

        finished->stop();
        finished.reset();
        if (owes_close && connection_handler) {
            CallbackScope scope;
            connection_handler(false);
        }

        lock.lock();
        if (mRestart) {
            continue;
        }
        if (!mShouldRun || !mAutoReconnect) {
            break;
        }
        if (mAttempts >= mConfig.max_attempts) {
            LOG_ERROR("Failed to connect to " + mConfig.url + " after " + std::to_string(mAttempts) + " attempts, giving up");
            break;
        }

        int  attempt           = ++mAttempts;
        auto delay             = std::chrono::milliseconds(mConfig.base_delay_ms) * attempt;
        auto reconnect_handler = mReconnectHandler;
        mState                 = StreamState::Connecting;
        lock.unlock();

        LOG_INFO("Reconnecting in " + std::to_string(delay.count()) + " ms (attempt " + std::to_string(attempt) + ")");
        if (reconnect_handler) {
            CallbackScope scope;
            reconnect_handler(attempt, delay);
        }

        lock.lock();
        mWake.wait_for(lock, delay, [this] { return !mShouldRun || mRestart; });
    }

    mShouldRun        = false;
    mState            = StreamState::Disconnected;
    mFirstAttemptDone = true;
    mWorkerRunning    = false;
    mWake.notify_all();
}

void ChatStreamClient::handleOpen(uint64_t generation) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (generation != mGeneration) {
            return;
        }
        mState            = StreamState::Connected;
        mAttempts         = 0;
        mWasOpen          = true;
        mFirstAttemptDone = true;
        handler           = mConnectionHandler;
        mWake.notify_all();
    }

    LOG_INFO("Connection established to " + mConfig.url);
    if (handler) {
        CallbackScope scope;
        handler(true);
    }
}

void ChatStreamClient::handleMessage(uint64_t generation, const std::string& frame) {
    ChatHandler handler;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (generation != mGeneration) {
            return;
        }
        handler = mChatHandler;
    }

    std::string sender;
    std::string message;
    try {
        auto data = nlohmann::json::parse(frame);
        auto type = data.value("type", std::string());
        if (type != "chat_message") {
            LOG_DEBUG("Ignoring '" + type + "' frame from chat server");
            return;
        }
        sender  = data.value("sender", std::string());
        message = data.at("message").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING(std::string("Error processing message: ") + e.what());
        return;
    }

    if (handler) {
        CallbackScope scope;
        try {
            handler(sender, message);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Chat handler threw: ") + e.what());
        }
    }
}

void ChatStreamClient::handleClose(uint64_t generation, const std::string& reason) {
    ConnectionHandler handler;
    bool              was_open = false;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (generation != mGeneration) {
            return;
        }
        was_open          = mWasOpen;
        mWasOpen          = false;
        mAttemptEnded     = true;
        mFirstAttemptDone = true;
        mState            = StreamState::Closing;
        handler           = mConnectionHandler;
        mWake.notify_all();
    }

    LOG_INFO("Connection closed: " + reason);
    // 从未 open 过的连接不回调 false
    if (was_open && handler) {
        CallbackScope scope;
        handler(false);
    }
}
