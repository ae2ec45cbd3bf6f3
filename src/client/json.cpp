#include "wormhole/client/json.hpp"

namespace wormhole::client {

void to_json(nlohmann::json& j, const ProgressEvent& event) {
    j = nlohmann::json{
        {"transferred", event.transferred},
        {"total", event.total},
        {"percent", event.percent},
    };
}

void to_json(nlohmann::json& j, const TransferOffer& offer) {
    j = nlohmann::json{
        {"filename", offer.filename},
        {"filesize", offer.filesize},
    };
}

} // namespace wormhole::client

namespace wormhole::core {

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"kind", to_string(error.kind())},
        {"message", error.message()},
        {"detail", error.detail()},
    };
}

} // namespace wormhole::core
