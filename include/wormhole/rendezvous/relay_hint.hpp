#pragma once

#include "wormhole/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wormhole::rendezvous {

/**
 * @brief Describes how to reach a transit relay when no direct path exists
 */
struct RelayHint {
    std::optional<std::string> name;
    std::vector<std::string> urls;

    /// Validates scheme (tcp, ws, wss) and host of every URL.
    static wormhole::Result<RelayHint> from_urls(std::optional<std::string> name,
                                                 std::vector<std::string> urls);
};

/// Hint set built from the compiled-in relay endpoint.
wormhole::Result<std::vector<RelayHint>> default_relay_hints();

} // namespace wormhole::rendezvous
