#pragma once

/// Umbrella header for the vlive tool-invocation server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "cancellation.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "dispatcher.hpp"
#include "router.hpp"
#include "builtin_tools.hpp"
#include "server.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
