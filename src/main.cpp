#include "app_config.hpp"
#include "echo_peer.hpp"
#include "errors.hpp"
#include "signal_handler.hpp"
#include "utils.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "usage: " << prog << " --listen [--bind HOST] [--port N]\n"
              << "       " << prog << " --connect HOST [--port N] [--type TYPE] [--data JSON]\n"
              << "options: --max-frame BYTES --header-timeout MS --log PATH --debug\n";
}

int main(int argc, char* argv[]) {
    framelink::AppConfig config;
    std::string data_json;
    // Basic argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--listen") {
                config.mode = "listen";
            } else if (arg == "--bind" && i + 1 < argc) {
                config.host = argv[++i];
            } else if (arg == "--connect" && i + 1 < argc) {
                config.mode = "connect";
                config.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                config.port = std::stoi(argv[++i]);
            } else if (arg == "--type" && i + 1 < argc) {
                config.message_type = argv[++i];
            } else if (arg == "--data" && i + 1 < argc) {
                data_json = argv[++i];
            } else if (arg == "--max-frame" && i + 1 < argc) {
                config.limits.max_frame_bytes = framelink::parse_frame_limit(argv[++i]);
            } else if (arg == "--header-timeout" && i + 1 < argc) {
                config.limits.header_timeout = std::chrono::milliseconds(std::stol(argv[++i]));
            } else if (arg == "--log" && i + 1 < argc) {
                config.log_path = argv[++i];
            } else if (arg == "--debug") {
                config.debug = true;
            } else {
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    if (!config.validate()) {
        print_usage(argv[0]);
        return 1;
    }

    initialize_logging(config.log_path, config.debug);
    setup_signal_handlers();

    framelink::EchoPeer peer(config);

    if (config.mode == "listen") {
        if (!peer.start_listening()) {
            return 1;
        }
        peer.serve(shutdown_requested);
        LOG_INFO("shutting down");
        return 0;
    }

    try {
        framelink::json payload = data_json.empty() ? framelink::json::object() : framelink::json::parse(data_json);
        auto reply = peer.request(framelink::Envelope(config.message_type, std::move(payload)));
        if (!reply) {
            LOG_ERROR("server closed the connection without replying");
            return 2;
        }
        std::cout << reply->serialize() << std::endl;
    } catch (const framelink::json::parse_error& e) {
        LOG_ERROR("--data is not valid JSON: %s", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    } catch (const framelink::ProtocolError& e) {
        LOG_ERROR("request failed (%s): %s", framelink::to_string(e.kind()), e.what());
        return 2;
    }
    return 0;
}
