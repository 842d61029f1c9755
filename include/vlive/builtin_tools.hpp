#pragma once
#include "registry.hpp"
#include "types.hpp"

namespace vlive {

/// Registers the `core` catalog tools:
///  - get_server_status: health, uptime, protocol versions, portmanteaus, tool count
///  - get_portmanteau_info(portmanteau): description and tool names of one category
///
/// The handlers read `registry` at call time, so tools added later are counted.
/// `registry` must outlive every invocation of these tools.
void add_builtin_tools(ToolRegistry& registry, const Implementation& server_info);

} // namespace vlive
