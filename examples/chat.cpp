#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "trovowire.hpp"
#include "common/cli/chat_params.hpp"

using namespace trovowire;
using namespace trovowire::core;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "Trovowire - Chat Example\n"
        "Reads the chat of one Trovo channel and prints every message as it arrives.\n");
    params.dump("=== Chat Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    http::Config http_config;
    http_config.client_id = auth::ClientId{params.client_id};
    http::Client api{http_config};

    auth::StaticTokenProvider provider{params.token};

    // Resolve the channel id from the username when needed
    std::string channel_id = params.channel;
    if (channel_id.empty()) {
        const http::Error err = api.lookup_channel_id(params.user, channel_id);
        if (err != http::Error::None) {
            TW_ERROR("Cannot resolve channel of user '" << params.user << "': " << err);
            return EXIT_FAILURE;
        }
        TW_INFO("User '" << params.user << "' -> channel " << channel_id);
    }

    chat::Config config;
    config.url = params.url;
    config.heartbeat_interval = std::chrono::seconds(params.heartbeat_s);
    config.staleness_window = std::chrono::seconds(params.staleness_s);

    auto stream = chat::open_chat(channel_id, provider, api, config);

    int exit_code = EXIT_SUCCESS;
    // Main polling loop
    while (running.load() && !stream.finished()) {
        stream.poll();   // REQUIRED to make progress
        const std::size_t n = stream.drain([&](const chat::Item& item) {
            switch (item.kind) {
                case chat::Item::Kind::Message:
                    std::cout << " -> " << item.message.nick_name << ": " << item.message.content << std::endl;
                    break;
                case chat::Item::Kind::DecodeError:
                    TW_WARN(" -> " << item.error);
                    break;
                case chat::Item::Kind::Fatal:
                    TW_ERROR(" -> " << item.error);
                    exit_code = EXIT_FAILURE;
                    break;
            }
        });
        if (n == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    // Ctrl+C received (or fatal error)
    stream.cancel();

    if (const auto* session = stream.session()) {
        std::cout << "\n=== Chat Summary ===\n"
                  << "  Links          : " << session->link_epoch() << "\n"
                  << "  Reconnects     : " << session->reconnect_attempts() << "\n"
                  << "  Frames rx / tx : " << session->rx_frames() << " / " << session->tx_frames() << "\n"
                  << "  Heartbeats     : " << session->heartbeats_sent() << " (pongs " << session->pongs_received() << ")\n"
                  << "  Decode errors  : " << session->decode_failures() << std::endl;
    }

    return exit_code;
}
