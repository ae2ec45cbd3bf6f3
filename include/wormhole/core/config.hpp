#pragma once

#include "wormhole/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace wormhole::core {

/// Relay used for transit fallback. Changing it requires a rebuild.
inline constexpr const char* kDefaultRelayServer = "wss://relay.magic-wormhole.io:443/v1";

inline constexpr std::size_t kDefaultCodeLength = 2;
inline constexpr std::size_t kMaxCodeLength = 64;
inline constexpr std::size_t kMaxTransitChunkSize = 16 * 1024 * 1024;

/**
 * @brief Runtime settings for a client and its loopback rendezvous
 *
 * Every field has a default, so an empty JSON object is a valid config.
 */
struct ClientConfig {
    std::size_t code_length = kDefaultCodeLength;
    std::string log_level = "info";
    std::size_t transit_chunk_size = 64 * 1024;
    std::chrono::milliseconds peer_timeout{120'000};
};

wormhole::Result<ClientConfig> parse_client_config(const std::string& json_text);

wormhole::Result<ClientConfig> load_client_config(const std::filesystem::path& path);

} // namespace wormhole::core
