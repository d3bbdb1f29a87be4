#include <catch2/catch.hpp>

#include "chat/chat_stream_client.hpp"
#include "common_fakes.hpp"

using namespace std::chrono_literals;

static RelayConfig fastConfig(int max_attempts = 3) {
    RelayConfig config;
    config.url           = "ws://relay.test:8080/chat";
    config.max_attempts  = max_attempts;
    config.base_delay_ms = 1;
    config.grace_ms      = 500;
    return config;
}

// 记录回调线程上发生的事件
struct Recorder {
    std::mutex                                              mutex;
    std::vector<bool>                                       connection_events;
    std::vector<std::pair<int, std::chrono::milliseconds>>  reconnects;
    std::vector<std::pair<std::string, std::string>>        chats;

    void attach(ChatStreamClient& client) {
        client.setConnectionHandler([this](bool connected) {
            std::lock_guard<std::mutex> lock(mutex);
            connection_events.push_back(connected);
        });
        client.setReconnectHandler([this](int attempt, std::chrono::milliseconds delay) {
            std::lock_guard<std::mutex> lock(mutex);
            reconnects.emplace_back(attempt, delay);
        });
        client.setChatHandler([this](const std::string& sender, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            chats.emplace_back(sender, message);
        });
    }

    std::vector<bool> events() {
        std::lock_guard<std::mutex> lock(mutex);
        return connection_events;
    }
    std::vector<int64_t> delays() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<int64_t> result;
        for (const auto& [attempt, delay] : reconnects) result.push_back(delay.count());
        return result;
    }
    std::vector<std::pair<std::string, std::string>> messages() {
        std::lock_guard<std::mutex> lock(mutex);
        return chats;
    }
};

TEST_CASE("send while disconnected fails without touching the network", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());

    auto status = client.send("hello");
    REQUIRE_FALSE(status);
    CHECK(status.error().kind == ErrorKind::NotConnected);
    CHECK(hub.created() == 0);
    CHECK(client.state() == StreamState::Disconnected);
}

TEST_CASE("connect opens the relay and send writes chat frames", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());

    REQUIRE(client.connect());
    CHECK(client.state() == StreamState::Connected);
    CHECK(hub.urls() == std::vector<std::string>{"ws://relay.test:8080/chat"});

    REQUIRE(client.send("hello"));
    REQUIRE(client.send("psst", std::string("steve")));

    auto frames = hub.log(0)->sentFrames();
    REQUIRE(frames.size() == 2);
    CHECK(nlohmann::json::parse(frames[0]) == nlohmann::json{{"type", "chat_message"}, {"message", "hello"}});
    CHECK(nlohmann::json::parse(frames[1]) == nlohmann::json{{"type", "chat_message"}, {"message", "psst"}, {"target", "steve"}});

    SECTION("connect while connected is a no-op") {
        CHECK(client.connect());
        CHECK(hub.created() == 1);
    }
}

TEST_CASE("An observer registered while connected hears true once", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    REQUIRE(client.connect());

    Recorder recorder;
    recorder.attach(client);
    CHECK(recorder.events() == std::vector<bool>{true});
}

TEST_CASE("disconnect closes the connection and reports false once", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    Recorder         recorder;
    recorder.attach(client);

    REQUIRE(client.connect());
    client.disconnect();

    CHECK(client.state() == StreamState::Disconnected);
    CHECK(hub.log(0)->stopped.load());
    CHECK(recorder.events() == std::vector<bool>{true, false});
    CHECK(recorder.delays().empty());
    CHECK(hub.created() == 1);
    CHECK(client.send("late").error().kind == ErrorKind::NotConnected);
}

TEST_CASE("A connection that never opened does not report false", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Close});
    ChatStreamClient client(fastConfig(), hub.factory());
    Recorder         recorder;
    recorder.attach(client);

    CHECK_FALSE(client.connect(false));
    REQUIRE(eventually([&] { return client.state() == StreamState::Disconnected; }));
    CHECK(hub.created() == 1);
    CHECK(recorder.events().empty());
    CHECK(recorder.delays().empty());
}

TEST_CASE("Reconnects are bounded with linear backoff", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Close});
    ChatStreamClient client(fastConfig(3), hub.factory());
    Recorder         recorder;
    recorder.attach(client);

    client.connect();
    REQUIRE(eventually([&] { return client.state() == StreamState::Disconnected && hub.created() == 4; }));

    // 一次初始连接加三次重试，随后放弃
    std::this_thread::sleep_for(20ms);
    CHECK(hub.created() == 4);
    CHECK(recorder.delays() == std::vector<int64_t>{1, 2, 3});
    CHECK(recorder.events().empty());

    SECTION("a new connect starts a fresh cycle") {
        client.connect(false);
        REQUIRE(eventually([&] { return client.state() == StreamState::Disconnected && hub.created() == 5; }));
        CHECK(recorder.delays().size() == 3);
    }
}

TEST_CASE("A successful open resets the attempt counter", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Close, FakeBehaviour::Close, FakeBehaviour::OpenThenClose, FakeBehaviour::Close});
    ChatStreamClient client(fastConfig(3), hub.factory());
    Recorder         recorder;
    recorder.attach(client);

    client.connect();
    REQUIRE(eventually([&] { return client.state() == StreamState::Disconnected && hub.created() == 6; }));

    CHECK(recorder.delays() == std::vector<int64_t>{1, 2, 1, 2, 3});
    CHECK(recorder.events() == std::vector<bool>{true, false});
}

TEST_CASE("A dropped connection is re-established", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    Recorder         recorder;
    recorder.attach(client);

    REQUIRE(client.connect());
    auto* first = hub.waitForConnection(1);
    REQUIRE(first != nullptr);
    first->close("server restarted");

    REQUIRE(eventually([&] { return hub.created() == 2 && client.isConnected(); }));
    CHECK(recorder.events() == std::vector<bool>{true, false, true});
    CHECK(recorder.delays() == std::vector<int64_t>{1});
    CHECK(hub.log(0)->stopped.load());
}

TEST_CASE("Inbound frames reach the chat observer", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    Recorder         recorder;
    recorder.attach(client);
    REQUIRE(client.connect());

    auto* connection = hub.waitForConnection(1);
    REQUIRE(connection != nullptr);
    connection->deliver(R"({"type":"chat_message","sender":"alex","message":"hi there"})");
    connection->deliver(R"({"type":"chat_message","message":"anonymous"})");
    connection->deliver(R"({"type":"presence","sender":"alex"})");
    connection->deliver("this is not json");
    connection->deliver(R"({"type":"chat_message","sender":"alex"})");

    auto messages = recorder.messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == std::make_pair(std::string("alex"), std::string("hi there")));
    CHECK(messages[1] == std::make_pair(std::string(), std::string("anonymous")));
    CHECK(client.isConnected());
}

TEST_CASE("disconnect from inside an observer does not deadlock", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    client.setChatHandler([&](const std::string&, const std::string& message) {
        if (message == "bye") client.disconnect();
    });
    REQUIRE(client.connect());

    hub.waitForConnection(1)->deliver(R"({"type":"chat_message","sender":"s","message":"bye"})");
    REQUIRE(eventually([&] { return client.state() == StreamState::Disconnected; }));
    CHECK(hub.created() == 1);
}

TEST_CASE("The connection observer can reconnect after disconnect", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    std::atomic<int>  closes{0};
    std::atomic<bool> reconnected_immediately{true};
    client.setConnectionHandler([&](bool connected) {
        if (!connected && closes++ == 0) {
            reconnected_immediately = client.connect(false);
        }
    });

    REQUIRE(client.connect());
    client.disconnect();

    REQUIRE(eventually([&] { return hub.created() == 2 && client.isConnected(); }));
    CHECK(closes.load() == 1);
    CHECK_FALSE(reconnected_immediately.load());
    CHECK(hub.log(0)->stopped.load());

    REQUIRE(client.send("back again"));
    CHECK(hub.log(1)->sentFrames().size() == 1);

    client.disconnect();
    CHECK(client.state() == StreamState::Disconnected);
    CHECK(closes.load() == 2);
    CHECK(hub.created() == 2);
}

TEST_CASE("A chat observer can bounce the connection", "[chat]") {
    FakeRelayHub     hub({FakeBehaviour::Open});
    ChatStreamClient client(fastConfig(), hub.factory());
    client.setChatHandler([&](const std::string&, const std::string& message) {
        if (message == "reset") {
            client.disconnect();
            client.connect(false);
        }
    });
    REQUIRE(client.connect());

    hub.waitForConnection(1)->deliver(R"({"type":"chat_message","sender":"s","message":"reset"})");
    REQUIRE(eventually([&] { return hub.created() == 2 && client.isConnected(); }));
    CHECK(hub.log(0)->stopped.load());
}
