/**
 * @file loopback_transfer.cpp
 * @brief Sends one file between two clients inside a single process
 *
 * The sender allocates a code, the receiver joins with it, and the file is
 * streamed through the in-process loopback relay. Progress samples and the
 * offer are printed as JSON lines, the way a host runtime would receive them.
 *
 * USAGE:
 *   loopback_transfer <file> [--out DIR] [--config FILE] [--words N] [--reject]
 */

#include "wormhole/client/client.hpp"
#include "wormhole/client/json.hpp"
#include "wormhole/core/config.hpp"
#include "wormhole/events/components.hpp"
#include "wormhole/events/event_bus.hpp"
#include "wormhole/rendezvous/loopback.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

using namespace wormhole;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <file> [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --out DIR       Directory the receiver writes into (default: current directory)\n";
    std::cout << "  --config FILE   JSON client config\n";
    std::cout << "  --words N       Number of words in the generated code\n";
    std::cout << "  --reject        Receiver declines the offer\n";
    std::cout << "  --help          Show this help message\n";
}

std::mutex g_output_mutex;

client::ProgressHandler print_progress(std::string side) {
    return [side = std::move(side)](const client::ProgressEvent& event) {
        nlohmann::json line = event;
        line["side"] = side;
        std::lock_guard lock(g_output_mutex);
        std::cout << line.dump() << std::endl;
    };
}

int report(const char* what, const core::Error& error) {
    const nlohmann::json j = error;
    spdlog::error("{} failed: {}", what, error.message());
    std::cerr << j.dump() << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string file;
    std::string out_dir = std::filesystem::current_path().string();
    std::optional<std::string> config_path;
    std::optional<std::size_t> words;
    bool reject = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--words" && i + 1 < argc) {
            try {
                words = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                spdlog::error("Invalid word count: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--reject") {
            reject = true;
        } else if (file.empty() && arg[0] != '-') {
            file = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    core::ClientConfig config;
    if (config_path) {
        auto loaded = core::load_client_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        config = loaded.value();
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    auto relay = std::make_shared<rendezvous::LoopbackRelay>();
    const auto options = rendezvous::LoopbackOptions::from_config(config);
    client::WormholeClient sender(std::make_shared<rendezvous::LoopbackRendezvous>(relay, options), bus, config);
    client::WormholeClient receiver(std::make_shared<rendezvous::LoopbackRendezvous>(relay, options), bus, config);

    auto code = sender.create_send_code(words);
    if (code.is_error()) {
        return report("create_send_code", code.error());
    }
    spdlog::info("Wormhole code is: {}", code.value());

    auto sending = std::async(std::launch::async, [&]() {
        return sender.send_file(file, print_progress("send"));
    });

    int status = 0;
    auto offer = receiver.connect_receive(code.value());
    if (offer.is_error()) {
        status = report("connect_receive", offer.error());
    } else {
        {
            const nlohmann::json j = offer.value();
            std::lock_guard lock(g_output_mutex);
            std::cout << j.dump() << std::endl;
        }

        if (reject) {
            auto rejected = receiver.reject_transfer();
            if (rejected.is_error()) {
                status = report("reject_transfer", rejected.error());
            }
        } else {
            auto path = receiver.accept_transfer(out_dir, print_progress("receive"));
            if (path.is_error()) {
                status = report("accept_transfer", path.error());
            } else {
                spdlog::info("Received {}", path.value());
            }
        }
    }

    auto sent = sending.get();
    if (sent.is_error() && !reject) {
        status = report("send_file", sent.error());
    }

    metrics.print_stats();
    return status;
}
