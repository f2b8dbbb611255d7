#include "client/console_input.hpp"
#include "client/network_client.hpp"
#include "common/command_line.hpp"
#include "protocol/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

using namespace ghack::protocol;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <name>" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --host <host>    Server host (default: localhost)" << std::endl;
    std::cout << "  -p, --port <port>    Server port (default: " << DEFAULT_PORT << ")" << std::endl;
    std::cout << "  -t, --token <token>  Auth token for the account" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

void print_message(const Envelope& envelope) {
    if (const auto* msg = envelope.get<AddEntityMsg>()) {
        std::cout << "+ entity " << msg->id;
        if (msg->name) std::cout << " '" << *msg->name << "'";
        std::cout << std::endl;
    } else if (const auto* msg = envelope.get<RemoveEntityMsg>()) {
        std::cout << "- entity " << msg->id << std::endl;
    } else if (const auto* msg = envelope.get<UpdateStateMsg>()) {
        std::cout << "  entity " << msg->id << " " << msg->state_id << " = " << describe(msg->value) << std::endl;
    } else if (const auto* msg = envelope.get<AssignControlMsg>()) {
        std::cout << (msg->is_revoked() ? "Lost control of entity " : "You control entity ") << msg->uid << std::endl;
    } else if (const auto* msg = envelope.get<EntityDeathMsg>()) {
        std::cout << msg->name.value_or("entity " + std::to_string(msg->uid)) << " died";
        if (msg->killer_uid || msg->killer_name) {
            std::cout << ", killed by " << msg->killer_name.value_or("entity " + std::to_string(msg->killer_uid.value_or(0)));
        }
        std::cout << std::endl;
    } else if (const auto* msg = envelope.get<CombatHitMsg>()) {
        std::cout << msg->attacker_name.value_or("entity " + std::to_string(msg->attacker_uid)) << " hits "
                  << msg->victim_name.value_or("entity " + std::to_string(msg->victim_uid)) << " for "
                  << msg->damage << std::endl;
    } else if (const auto* msg = envelope.get<LoginResultMsg>()) {
        if (!msg->succeeded) {
            std::cout << "Login refused: " << to_string(msg->reason.value_or(LoginReason::AccessDenied)) << std::endl;
        }
    } else if (const auto* msg = envelope.get<DisconnectMsg>()) {
        std::cout << "Server disconnected us: " << to_string(msg->reason);
        if (msg->reason_str) std::cout << " (" << *msg->reason_str << ")";
        std::cout << std::endl;
    }
}

void list_entities(const ghack::client::NetworkClient& client) {
    auto table = client.entities();
    auto controlled = client.controlled_entity();
    std::cout << table.size() << " entities" << std::endl;
    for (const auto& [id, record] : table.entities()) {
        std::cout << (controlled && *controlled == id ? "* " : "  ") << id;
        if (!record.name.empty()) std::cout << " '" << record.name << "'";
        std::cout << std::endl;
        for (const auto& [state_id, value] : record.states) {
            std::cout << "      " << state_id << " = " << describe(value) << std::endl;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string host = "localhost";
    uint16_t port = DEFAULT_PORT;
    ghack::client::Credentials credentials;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            auto parsed = ghack::parse_port(argv[++i]);
            if (!parsed) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
            port = *parsed;
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            credentials.authtoken = argv[++i];
        } else {
            credentials.name = arg;
        }
    }

    if (credentials.name.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "=== ghack client ===" << std::endl;
    std::cout << "Server: " << host << ":" << port << std::endl;
    std::cout << "Commands: move <x> <y> [z], list, quit" << std::endl;

    ghack::client::NetworkClient client(credentials);
    client.set_message_callback(print_message);
    if (!client.connect(host, port)) {
        return 1;
    }

    // Console input is read on its own thread so the network keeps flowing
    auto input = ghack::client::ConsoleInput::start(std::cin);

    bool running = true;
    while (running) {
        client.poll_messages();

        for (const auto& line : input->take()) {
            std::istringstream in(line);
            std::string command;
            in >> command;
            if (command == "move") {
                double x = 0.0, y = 0.0, z = 0.0;
                if (!(in >> x >> y)) {
                    std::cout << "usage: move <x> <y> [z]" << std::endl;
                    continue;
                }
                in >> z;
                client.send_move(Vector3(x, y, z));
            } else if (command == "list") {
                list_entities(client);
            } else if (command == "quit") {
                running = false;
            } else if (!command.empty()) {
                std::cout << "Unknown command '" << command << "'" << std::endl;
            }
        }

        if (!client.is_connected() || input->done()) {
            running = false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    client.poll_messages();
    client.disconnect();
    if (auto reason = client.close_reason()) {
        std::cout << "Disconnected: " << to_string(*reason) << std::endl;
    }
    return 0;
}
