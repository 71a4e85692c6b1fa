#pragma once

#define BRIDGE_VERSION "1.2.0"
#define BRIDGE_SCHEMA_VERSION 2
#define BRIDGE_MCP_PROTOCOL_VERSION "2024-11-05"

namespace bridge {
namespace version {

// A database written by a newer binary may carry columns we don't know.
// Older schemas are upgraded in place on open.
inline bool schema_compatible(int on_disk) {
    return on_disk >= 0 && on_disk <= BRIDGE_SCHEMA_VERSION;
}

} // namespace version
} // namespace bridge
