// This is the single entry point for the remotectl library.
// Include this file to get access to the core public API.

#pragma once

// Core data types and errors
#include "remotectl/core/types.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "remotectl/core/util/peer_options.hpp"
#include "remotectl/core/util/logger.hpp"

// Commands and the wire codec
#include "remotectl/core/command/remote_command.hpp"
#include "remotectl/core/command/command_router.hpp"
#include "remotectl/core/protocol/session_codec.hpp"

// Session engine and controller
#include "remotectl/core/peer/remote_peer.hpp"
#include "remotectl/core/controller/session_controller.hpp"

// Public interfaces for extension
#include "remotectl/core/interfaces/itransport.hpp"
#include "remotectl/core/interfaces/ischeduler.hpp"
#include "remotectl/core/interfaces/imedia_player.hpp"
#include "remotectl/core/interfaces/IBackoffStrategy.hpp"

// Default implementations
#include "remotectl/core/util/timer_queue.hpp"
#include "remotectl/core/strategies/exponential_backoff.hpp"
#include "remotectl/core/strategies/linear_backoff.hpp"
#include "remotectl/transports/websocket/websocket_transport.hpp"
#include "remotectl/transports/websocket/websocket_client_transport.hpp"
