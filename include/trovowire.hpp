#pragma once

/*
===============================================================================
Trovowire — Public API Entry Point
===============================================================================

Trovowire is a client library for the Trovo live-streaming platform:

  - trovowire::chat          the chat feed of one channel as an ordered,
                             self-healing sequence of decoded messages
  - trovowire::core::auth    access token providers (static, OAuth refresh)
  - trovowire::core::http    Trovo HTTP API collaborator (chat token,
                             user / channel lookup, token refresh, send)

The core layers (transport, protocol, session) are usable directly for
custom compositions; their seams are C++20 concepts.
===============================================================================
*/

#include <trovowire/chat/stream.hpp>
#include <trovowire/core/auth/static_token_provider.hpp>
#include <trovowire/core/auth/oauth_token_provider.hpp>
#include <trovowire/core/http/client.hpp>
#include <lcr/log/logger.hpp>
