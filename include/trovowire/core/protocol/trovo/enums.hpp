#pragma once

#include "trovowire/core/protocol/trovo/enums/frame_type.hpp"
#include "trovowire/core/protocol/trovo/enums/chat_message_type.hpp"
