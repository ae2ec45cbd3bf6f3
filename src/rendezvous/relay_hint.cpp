#include "wormhole/rendezvous/relay_hint.hpp"

#include "wormhole/core/config.hpp"

#include <array>
#include <string_view>

namespace wormhole::rendezvous {
namespace {

constexpr std::array<std::string_view, 3> kSchemes{"tcp", "ws", "wss"};

wormhole::Result<void> validate_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return wormhole::Err("relay URL has no scheme: " + url);
    }

    const std::string_view scheme(url.data(), scheme_end);
    bool supported = false;
    for (auto candidate : kSchemes) {
        supported = supported || candidate == scheme;
    }
    if (!supported) {
        return wormhole::Err("unsupported relay URL scheme: " + url);
    }

    const auto host_start = scheme_end + 3;
    const auto host_end = url.find_first_of(":/", host_start);
    const auto host = url.substr(host_start, host_end == std::string::npos ? std::string::npos
                                                                           : host_end - host_start);
    if (host.empty()) {
        return wormhole::Err("relay URL has no host: " + url);
    }
    return wormhole::Ok();
}

} // namespace

wormhole::Result<RelayHint> RelayHint::from_urls(std::optional<std::string> name,
                                                 std::vector<std::string> urls) {
    if (urls.empty()) {
        return wormhole::Err(std::string("relay hint needs at least one URL"));
    }
    for (const auto& url : urls) {
        if (auto res = validate_url(url); res.is_error()) {
            return wormhole::Err(res.error());
        }
    }

    RelayHint hint;
    hint.name = std::move(name);
    hint.urls = std::move(urls);
    return wormhole::Ok(std::move(hint));
}

wormhole::Result<std::vector<RelayHint>> default_relay_hints() {
    auto hint = RelayHint::from_urls(std::nullopt, {core::kDefaultRelayServer});
    if (hint.is_error()) {
        return wormhole::Err(hint.error());
    }
    return wormhole::Ok(std::vector<RelayHint>{std::move(hint.value())});
}

} // namespace wormhole::rendezvous
