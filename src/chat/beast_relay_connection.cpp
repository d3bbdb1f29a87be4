#include "beast_relay_connection.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

#include "utils/logger.hpp"
#include "utils/regular.hpp"

static constexpr auto kConnectTimeout   = std::chrono::seconds(10);
static constexpr auto kHandshakeTimeout = std::chrono::seconds(10);

BeastRelayConnection::BeastRelayConnection(const std::string& url)
    : mUrl(url) {
    auto parts = Regular::parseUrl(url);
    if (parts && parts->scheme == "ws") {
        mHost     = parts->host;
        mPort     = std::to_string(parts->port);
        mTarget   = parts->target;
        mValidUrl = true;
    }
}

BeastRelayConnection::~BeastRelayConnection() { stop(); }

void BeastRelayConnection::start() {
    if (!mRunning.exchange(true)) {
        mThread = std::thread(&BeastRelayConnection::run, this);
    }
}

void BeastRelayConnection::stop() {
    if (!mThread.joinable()) {
        return;
    }
    net::post(mIoc, [this]() { doClose(); });
    mThread.join();
    mRunning = false;
}

bool BeastRelayConnection::send(const std::string& frame) {
    if (!mRunning || !mAccepting) {
        return false;
    }
    net::post(mIoc, [this, frame]() {
        if (!mOpen || mFinished) {
            LOG_WARNING("Dropping outbound frame, connection to " + mUrl + " is closed");
            return;
        }
        mOutbox.push_back(frame);
        if (mOutbox.size() == 1) {
            doWrite();
        }
    });
    return true;
}

void BeastRelayConnection::run() {
    if (!mValidUrl) {
        finish("unsupported relay URL: " + mUrl);
        return;
    }
    LOG_DEBUG("Connecting to " + mUrl);
    mResolver.async_resolve(mHost, mPort, beast::bind_front_handler(&BeastRelayConnection::onResolve, this));
    mIoc.run();
}

void BeastRelayConnection::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec || mStopRequested) {
        finish(ec ? "resolve: " + ec.message() : "closed by client");
        return;
    }
    beast::get_lowest_layer(mWs).expires_after(kConnectTimeout);
    beast::get_lowest_layer(mWs).async_connect(results, beast::bind_front_handler(&BeastRelayConnection::onConnect, this));
}

void BeastRelayConnection::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
    if (ec || mStopRequested) {
        finish(ec ? "connect: " + ec.message() : "closed by client");
        return;
    }

    // websocket 自己管理超时，关闭 tcp_stream 上的定时器
    beast::get_lowest_layer(mWs).expires_never();

    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = kHandshakeTimeout;
    timeouts.idle_timeout      = websocket::stream_base::none();
    timeouts.keep_alive_pings  = false;
    mWs.set_option(timeouts);
    mWs.set_option(websocket::stream_base::decorator([](websocket::request_type& req) { req.set(beast::http::field::user_agent, "xblchat"); }));

    mWs.async_handshake(mHost + ":" + std::to_string(endpoint.port()), mTarget, beast::bind_front_handler(&BeastRelayConnection::onHandshake, this));
}

void BeastRelayConnection::onHandshake(beast::error_code ec) {
    if (ec || mStopRequested) {
        finish(ec ? "handshake: " + ec.message() : "closed by client");
        return;
    }
    mOpen      = true;
    mAccepting = true;
    mWs.text(true);
    if (on_open) on_open();
    doRead();
}

void BeastRelayConnection::doRead() { mWs.async_read(mBuffer, beast::bind_front_handler(&BeastRelayConnection::onRead, this)); }

void BeastRelayConnection::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        finish(ec == websocket::error::closed ? "closed by server" : "read: " + ec.message());
        return;
    }
    std::string payload = beast::buffers_to_string(mBuffer.data());
    mBuffer.consume(mBuffer.size());
    if (on_message) on_message(payload);
    if (!mFinished) {
        doRead();
    }
}

void BeastRelayConnection::doWrite() {
    mWs.async_write(net::buffer(mOutbox.front()), beast::bind_front_handler(&BeastRelayConnection::onWrite, this));
}

void BeastRelayConnection::onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
        mOutbox.clear();
        finish("write: " + ec.message());
        return;
    }
    mOutbox.pop_front();
    if (!mOutbox.empty() && !mFinished) {
        doWrite();
    }
}

void BeastRelayConnection::doClose() {
    mStopRequested = true;
    mAccepting     = false;
    mResolver.cancel();
    if (mOpen && mWs.is_open()) {
        mWs.async_close(websocket::close_code::normal, beast::bind_front_handler(&BeastRelayConnection::onClose, this));
        return;
    }
    // 还没握手完成：直接关 socket，挂起的 connect/handshake 会以 operation_aborted 结束
    beast::get_lowest_layer(mWs).close();
}

void BeastRelayConnection::onClose(beast::error_code ec) {
    if (ec) {
        LOG_DEBUG("Close handshake with " + mUrl + " failed: " + ec.message());
        beast::get_lowest_layer(mWs).close();
    }
    finish("closed by client");
}

void BeastRelayConnection::finish(const std::string& reason) {
    if (mFinished) {
        return;
    }
    mFinished  = true;
    mOpen      = false;
    mAccepting = false;
    LOG_DEBUG("Connection to " + mUrl + " finished: " + reason);
    if (on_close) on_close(reason);
}

std::unique_ptr<RelayConnection> makeBeastRelayConnection(const std::string& url) { return std::make_unique<BeastRelayConnection>(url); }
