#include "wormhole/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace wormhole::core {
using json = nlohmann::json;

namespace {

const char* const kKnownLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool is_known_level(const std::string& level) {
    for (const char* known : kKnownLevels) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

// json::value() would wrap a negative number into a huge size_t.
wormhole::Result<std::size_t> read_count(const json& doc, const char* key, std::size_t fallback) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return wormhole::Ok(fallback);
    }
    if (!it->is_number_unsigned()) {
        return wormhole::Err(std::string(key) + " must be a non-negative integer");
    }
    return wormhole::Ok(it->get<std::size_t>());
}

} // namespace

wormhole::Result<ClientConfig> parse_client_config(const std::string& json_text) {
    const auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return wormhole::Err(std::string("Malformed config: not valid JSON"));
    }
    if (!doc.is_object()) {
        return wormhole::Err(std::string("Config root must be a JSON object"));
    }

    ClientConfig config;
    auto code_length = read_count(doc, "code_length", config.code_length);
    if (code_length.is_error()) {
        return wormhole::Err(code_length.error());
    }
    auto chunk_size = read_count(doc, "transit_chunk_size", config.transit_chunk_size);
    if (chunk_size.is_error()) {
        return wormhole::Err(chunk_size.error());
    }
    config.code_length = code_length.value();
    config.transit_chunk_size = chunk_size.value();

    try {
        config.log_level = doc.value("log_level", config.log_level);
        config.peer_timeout = std::chrono::milliseconds(
            doc.value("peer_timeout_ms", static_cast<std::int64_t>(config.peer_timeout.count())));
    } catch (const json::type_error& e) {
        return wormhole::Err(std::string("Invalid config value: ") + e.what());
    }

    if (config.code_length == 0 || config.code_length > kMaxCodeLength) {
        return wormhole::Err("code_length must be between 1 and " + std::to_string(kMaxCodeLength));
    }
    if (config.transit_chunk_size == 0 || config.transit_chunk_size > kMaxTransitChunkSize) {
        return wormhole::Err("transit_chunk_size must be between 1 and " + std::to_string(kMaxTransitChunkSize));
    }
    if (config.peer_timeout.count() <= 0) {
        return wormhole::Err(std::string("peer_timeout_ms must be > 0"));
    }
    if (!is_known_level(config.log_level)) {
        return wormhole::Err(std::string("Unknown log_level: ") + config.log_level);
    }

    return wormhole::Ok(config);
}

wormhole::Result<ClientConfig> load_client_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return wormhole::Err(std::string("Failed to open config file: ") + path.string());
    }

    std::ostringstream content;
    content << input.rdbuf();

    auto result = parse_client_config(content.str());
    if (result.is_ok()) {
        spdlog::debug("Loaded client config from {}", path.string());
    }
    return result;
}

} // namespace wormhole::core
