#pragma once
#include <functional>
#include <memory>
#include <string>

/**
 * 一次连接尝试。事件回调在连接自己的执行上下文中触发：
 * on_open 至多一次；on_close 至多一次，无论之前是否 open 过。
 * stop() 返回之后不会再有任何回调。
 */
class RelayConnection {
public:
    virtual ~RelayConnection() = default;

    virtual void start() = 0;
    virtual void stop()  = 0;

    // 入队一条文本帧；连接已关闭时返回 false
    virtual bool send(const std::string& frame) = 0;

    std::function<void()>                   on_open;
    std::function<void(const std::string&)> on_message;
    std::function<void(const std::string&)> on_close;
};

using RelayConnectionFactory = std::function<std::unique_ptr<RelayConnection>(const std::string& url)>;
