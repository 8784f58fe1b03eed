#pragma once

/// Umbrella header for the toolwire MCP tool server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framing.hpp"
#include "schema.hpp"
#include "tool_registry.hpp"
#include "session.hpp"
#include "router.hpp"
#include "worker_pool.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
