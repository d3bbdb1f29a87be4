#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "xblchat.hpp"

static void printUsage() {
    std::cerr << "Usage: xblchat <command> [options]\n"
                 "\n"
                 "Commands:\n"
                 "  token        Print the XBL3.0 credential on stdout\n"
                 "  chat         Connect to the chat relay and relay stdin lines\n"
                 "  init-config  Write a config file with the default settings\n"
                 "\n"
                 "Options:\n"
                 "  --config <file>  Config file (default: config.json)\n"
                 "  --url <ws-url>   Chat relay URL, overrides the config file\n"
                 "  --verbose        Enable debug diagnostics\n";
}

static std::filesystem::path applicationDirectory(const char* argv0) {
    std::error_code ec;
    auto            exe = std::filesystem::canonical("/proc/self/exe", ec);
    if (!ec) {
        return exe.parent_path();
    }
    auto from_argv = std::filesystem::absolute(argv0, ec);
    if (!ec && from_argv.has_parent_path()) {
        return from_argv.parent_path();
    }
    return std::filesystem::current_path();
}

// stdout 只留给最终凭据，所有诊断信息都写到 stderr
static int runToken(const AppConfig& config, const std::filesystem::path& app_dir) {
    auto location = resolveCacheLocation(config.cache.file_name, config.cache.directory, app_dir);
    LOG_INFO("Token cache location: " + (location ? location->string() : std::string("in-memory only (no persistence)")));

    CredentialCache  cache(location);
    HttplibTransport transport(std::chrono::seconds(config.http.connect_timeout_seconds),
                               std::chrono::seconds(config.http.read_timeout_seconds),
                               config.http.user_agent);

    MSAL msal(config.auth, cache, transport);

    XstsExchanger      exchanger(config.auth, transport);
    CredentialPipeline pipeline(config.auth, cache, msal, exchanger);

    auto credential = pipeline.getCompositeCredential();
    if (!credential) {
        LOG_ERROR("Failed to get " + config.auth.scheme + " token: " + credential.error().describe());
        return 1;
    }

    std::cout << credential.value() << std::endl;
    return 0;
}

static int runChat(const AppConfig& config) {
    ChatStreamClient client(config.relay);

    client.setChatHandler([](const std::string& sender, const std::string& message) { std::cout << "[" << sender << "] " << message << std::endl; });
    client.setConnectionHandler([](bool connected) {
        std::cout << (connected ? "Connected to chat relay!" : "Disconnected from chat relay") << std::endl;
    });
    client.setReconnectHandler([](int attempt, std::chrono::milliseconds delay) {
        std::cerr << "Reconnecting in " << delay.count() << " ms (attempt " << attempt << ")" << std::endl;
    });

    if (!client.connect()) {
        std::cerr << "Could not connect to " << config.relay.url << ". Make sure the relay is running." << std::endl;
        client.disconnect();
        return 1;
    }

    std::cout << "Listening for chat messages. Type 'exit' to quit." << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "exit") {
            break;
        }
        if (line.empty()) {
            continue;
        }
        auto status = client.send(line);
        if (!status) {
            std::cerr << "Send failed: " << status.error().describe() << std::endl;
        }
    }

    client.disconnect();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 2;
    }

    std::string           command = argv[1];
    std::filesystem::path config_path("config.json");
    std::string           url_override;
    bool                  verbose = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--url" && i + 1 < argc) {
            url_override = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            printUsage();
            return 2;
        }
    }

    Logger::getInstance().setMinimumLevel(verbose ? LogLevel::Debug : LogLevel::Info);
    Logger::getInstance().setLogCallback([](LogLevel level, const std::string& message) {
        std::cerr << "[" << toString(level) << "] " << message << std::endl;
    });

    try {
        if (command == "init-config") {
            saveConfig(config_path, AppConfig{});
            LOG_INFO("Wrote default config to " + config_path.string());
            return 0;
        }

        AppConfig config = loadConfig(config_path);
        if (!url_override.empty()) {
            config.relay.url = url_override;
        }

        if (command == "token") {
            return runToken(config, applicationDirectory(argv[0]));
        }
        if (command == "chat") {
            return runChat(config);
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("Unhandled exception: ") + e.what());
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    printUsage();
    return 2;
}
