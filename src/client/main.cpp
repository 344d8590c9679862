#include "client/relay_client.hpp"
#include "common/log.hpp"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace relaysync;
using namespace relaysync::client;

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

void print_usage(const char* program) {
    std::cout << "RelaySync Client\n\n"
              << "Usage: " << program << " -u <ws-url> [options]\n\n"
              << "Options:\n"
              << "  -u, --url <url>         Relay WebSocket URL (overrides config)\n"
              << "  -s, --session <id>      Join an existing session (default: create one)\n"
              << "  -c, --config <file>     JSON config file\n"
              << "  -r, --role <role>       active or passive (default: stay idle)\n"
              << "  -l, --log-level <l>     Log level: trace/debug/info/warn/error\n"
              << "  -h, --help              Show help\n\n"
              << "Environment (used when -l is not given):\n"
              << "  RELAYSYNC_LOG_LEVEL     Log level\n"
              << "  RELAYSYNC_LOG_FILE      Rotating log file path\n\n"
              << "Examples:\n"
              << "  " << program << " -u ws://localhost:8080/ws --role active\n"
              << "  " << program << " -u wss://relay.example.com/ws -s 3f9c2a --role passive\n"
              << std::endl;
}

// An explicit -l wins; otherwise RELAYSYNC_LOG_* override the config file
bool setup_logging(const std::string& level, const std::string& file, bool explicit_level) {
    auto parsed = log::level_from_string(level);
    if (!parsed) {
        std::cerr << "Invalid log level: " << level << "\n";
        return false;
    }
    log::LogConfig config;
    config.level = *parsed;
    config.file_path = file;
    if (explicit_level) {
        log::init(config);
    } else {
        log::init_from_env(config);
    }
    return true;
}

TutorialSyncState demo_state() {
    TutorialSyncState state;
    state.tutorial_id = "relaysync-demo";
    state.tutorial_title = "RelaySync Demo";
    state.total_steps = 3;
    state.step_content.id = "step-1";
    state.step_content.title = "Getting started";
    state.step_content.commit_hash = "0000000";
    state.step_content.type = "section";
    state.step_content.index = 0;
    return state;
}

std::string describe(const RelayClientEvent& event) {
    return std::visit(overloaded{
        [](const ConnectedEvent& e) {
            return fmt::format("client {} in session {}", e.client_id, e.session_id);
        },
        [](const DisconnectedEvent& e) {
            return fmt::format("{}{}", e.reason, e.will_reconnect ? " (will reconnect)" : "");
        },
        [](const ConnectionStatusChangedEvent& e) {
            return std::string(connection_status_name(e.status));
        },
        [](const ReconnectingEvent& e) {
            return fmt::format("attempt {} in {}ms", e.attempt, e.delay.count());
        },
        [](const PhaseChangedEvent& e) {
            return fmt::format("{} -> {} ({})", sync_phase_name(e.previous), sync_phase_name(e.phase), e.reason);
        },
        [](const SessionCreatedEvent& e) { return e.session.id; },
        [](const ClientConnectedEvent& e) { return e.client_id; },
        [](const ClientDisconnectedEvent& e) { return e.client_id; },
        [](const PeerRoleChangedEvent& e) {
            return fmt::format("{} is {}", e.client_id, protocol::peer_role_to_string(e.role));
        },
        [](const TutorialStateReceivedEvent& e) {
            return fmt::format("{} step {} from {}", e.state.tutorial_id, e.state.step_content.id,
                               e.from_client_id);
        },
        [](const ControlOfferedEvent& e) {
            return fmt::format("offer {} from {}", e.offer.offer_id(), e.offer.from_client_id());
        },
        [](const ControlAcceptedEvent& e) { return e.by_client_id; },
        [](const ControlDeclinedEvent& e) { return e.by_client_id; },
        [](const ControlReleasedEvent& e) { return e.from_client_id; },
        [](const ErrorEvent& e) { return e.error.to_string(); },
    }, event);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string server_url;
    std::string session_id;
    std::string role;
    std::optional<std::string> log_level;

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
            server_url = argv[++i];
        }
        else if ((arg == "-s" || arg == "--session") && i + 1 < argc) {
            session_id = argv[++i];
        }
        else if ((arg == "-r" || arg == "--role") && i + 1 < argc) {
            role = argv[++i];
        }
        else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!role.empty() && role != "active" && role != "passive") {
        std::cerr << "Invalid role: " << role << " (expected active or passive)\n";
        return 1;
    }

    RelayClientConfig config;
    if (!config_file.empty()) {
        auto loaded = RelayClientConfig::load(config_file);
        if (!loaded) {
            std::cerr << "Error: " << config_file << ": " << config_error_message(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    if (!server_url.empty()) config.server_url = server_url;
    if (log_level) config.log_level = *log_level;

    if (config.server_url.empty()) {
        std::cerr << "Error: No relay URL. Provide one with -u <url> or a config file.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!setup_logging(config.log_level, config.log_file, log_level.has_value())) {
        return 1;
    }
    log::Logger logger(log::MAIN_LOGGER);

    boost::asio::io_context ioc;
    RelayClient* client_ptr = nullptr;
    int exit_code = 0;

    config.event_handler = [&](const RelayClientEvent& event) {
        logger.info("[{}] {}", event_name(event), describe(event));

        if (std::holds_alternative<ConnectedEvent>(event)) {
            if (role == "active") {
                client_ptr->sync.as_active();
            } else if (role == "passive") {
                client_ptr->sync.as_passive();
            }
        } else if (auto* phase = std::get_if<PhaseChangedEvent>(&event)) {
            if (phase->phase == SyncPhase::ACTIVE && !client_ptr->tutorial.last_state()) {
                client_ptr->tutorial.send_state(demo_state());
            } else if (phase->phase == SyncPhase::PASSIVE) {
                client_ptr->tutorial.request_state();
            }
        } else if (auto* offered = std::get_if<ControlOfferedEvent>(&event)) {
            if (role == "passive") {
                offered->offer.decline();
            } else {
                offered->offer.accept();
            }
        } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
            if (error->error.type == SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED) {
                logger.error("Giving up on {}", client_ptr->session.id().value_or(config_file));
                exit_code = 1;
                ioc.stop();
            }
        }
    };

    try {
        RelayClient client(ioc, config);
        client_ptr = &client;

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) {
                return;
            }
            logger.info("Received signal {}, shutting down...", sig);
            client.disconnect();
            ioc.stop();
        });

        logger.info("RelaySync client v1.0 (log level {})", log::level_name(log::get_level()));
        logger.info("Relay: {}", config.server_url);
        if (session_id.empty()) {
            client.connect();
        } else {
            client.connect(session_id);
        }

        ioc.run();
        signals.cancel();
        client_ptr = nullptr;
        logger.info("Client stopped");
    } catch (const std::exception& e) {
        logger.error("Fatal: {}", e.what());
        exit_code = 1;
    }

    log::shutdown();
    return exit_code;
}
