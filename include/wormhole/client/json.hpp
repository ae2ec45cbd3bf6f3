#pragma once

#include "wormhole/client/types.hpp"
#include "wormhole/core/error.hpp"

#include <nlohmann/json.hpp>

// Shapes handed to a host runtime across the binding boundary.

namespace wormhole::client {

void to_json(nlohmann::json& j, const ProgressEvent& event);
void to_json(nlohmann::json& j, const TransferOffer& offer);

} // namespace wormhole::client

namespace wormhole::core {

void to_json(nlohmann::json& j, const Error& error);

} // namespace wormhole::core
