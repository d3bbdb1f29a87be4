#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <thread>

#include "chat/relay_connection.hpp"
#include "xblchat_export.hpp"

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

// ----------------------------------------------------------------------------
// BeastRelayConnection
// One ws:// connection attempt on its own io_context thread. Knows nothing
// about the chat payloads; the stream client drives reconnects.
// ----------------------------------------------------------------------------
class XBLCHAT_API BeastRelayConnection : public RelayConnection {
public:
    explicit BeastRelayConnection(const std::string& url);
    ~BeastRelayConnection() override;

    void start() override;
    void stop() override;
    bool send(const std::string& frame) override;

    BeastRelayConnection(const BeastRelayConnection&)            = delete;
    BeastRelayConnection& operator=(const BeastRelayConnection&) = delete;

private:
    void run();
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint);
    void onHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes);
    void doClose();
    void onClose(beast::error_code ec);
    void finish(const std::string& reason);

    std::string mUrl;
    std::string mHost;
    std::string mPort;
    std::string mTarget;
    bool        mValidUrl = false;

    net::io_context                      mIoc;
    tcp::resolver                        mResolver{mIoc};
    websocket::stream<beast::tcp_stream> mWs{mIoc};
    beast::flat_buffer                   mBuffer;
    std::deque<std::string>              mOutbox;

    // 以下三个标志只在 io 线程上访问
    bool mOpen          = false;
    bool mFinished      = false;
    bool mStopRequested = false;

    std::atomic<bool> mRunning{false};
    std::atomic<bool> mAccepting{false}; // 握手完成且尚未关闭，send() 据此拒绝新帧
    std::thread       mThread;
};

XBLCHAT_API std::unique_ptr<RelayConnection> makeBeastRelayConnection(const std::string& url);
