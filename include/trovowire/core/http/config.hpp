#pragma once

#include <chrono>
#include <string>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/config/endpoints.hpp"

namespace trovowire::core::http {

// Runtime configuration of the REST client.
struct Config {
    auth::ClientId client_id;
    std::string host{config::API_HOST};
    std::string port{config::API_PORT};
    std::string base{config::API_BASE};
    std::chrono::milliseconds timeout{10000};   // bounds one whole request (resolve .. response)
    bool verify_peer{true};
};

} // namespace trovowire::core::http
