#include <iostream>
#include <string>
#include "config.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "session_store.hpp"
#include "tcp_transport.hpp"
#include "transfer_receiver.hpp"
#include "transfer_sender.hpp"
#include "ferry/hex_utils.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " --receive <port> [--config <file.json>]\n"
              << "  " << program << " --send <host>:<port> <file> [--config <file.json>]\n"
              << "  " << program << " --manifest <file> [--config <file.json>]\n"
              << "  " << program << " --status <session_dir> <session_id>\n"
              << "  " << program << " --write-config <file.json>" << std::endl;
}

// Looks for "--config <path>" anywhere after the command.
ferry::Config config_from_args(int argc, char* argv[]) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            std::cout << "[Config] Loading " << argv[i + 1] << std::endl;
            return ferry::load_config(argv[i + 1]);
        }
    }
    return ferry::Config();
}

int run_receive(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    ferry::Config config = config_from_args(argc, argv);
    unsigned short port = static_cast<unsigned short>(std::stoi(argv[2]));

    auto transport = ferry::TcpTransport::accept(port);
    ferry::TransferReceiver receiver(config, *transport);
    auto path = receiver.receive_file();
    transport->close();
    return path ? 0 : 2;
}

int run_send(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }
    ferry::Config config = config_from_args(argc, argv);

    std::string host_port = argv[2];
    size_t colon_pos = host_port.find(':');
    if (colon_pos == std::string::npos) {
        std::cerr << "Invalid host:port format" << std::endl;
        return 1;
    }
    std::string host = host_port.substr(0, colon_pos);
    std::string port = host_port.substr(colon_pos + 1);

    auto transport = ferry::TcpTransport::connect(host, port);
    ferry::TransferSender sender(config, *transport);
    bool ok = sender.send_file(argv[3]);
    transport->close();
    return ok ? 0 : 2;
}

int run_manifest(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    ferry::Config config = config_from_args(argc, argv);
    ferry::Manifest manifest = ferry::build_manifest(argv[2], config.chunk_size);
    std::string path = ferry::manifest_path_for(argv[2]);
    ferry::save_manifest(manifest, path);
    std::cout << "Wrote " << path << ": session " << manifest.session_id << ", " << manifest.total_chunks
              << " chunks, file hash " << ferry::util::to_hex(manifest.file_hash) << std::endl;
    return 0;
}

int run_status(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }
    ferry::SessionStore store(argv[2]);
    auto bitmap = store.load_bitmap(argv[3]);
    if (!bitmap) {
        std::cerr << "No checkpoint for session " << argv[3] << " in " << argv[2] << std::endl;
        return 1;
    }
    std::cout << "Session " << argv[3] << ": " << bitmap->received_count();
    if (bitmap->total_chunks()) {
        std::cout << "/" << *bitmap->total_chunks() << " chunks (" << bitmap->progress() << "%)";
    } else {
        std::cout << " chunks, total unknown";
    }
    std::cout << std::endl;
    for (const auto& gap : bitmap->find_gaps()) {
        std::cout << "  missing " << gap.first << "-" << gap.second << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::string command = argv[1];
        if (command == "--receive") {
            return run_receive(argc, argv);
        } else if (command == "--send") {
            return run_send(argc, argv);
        } else if (command == "--manifest") {
            return run_manifest(argc, argv);
        } else if (command == "--status") {
            return run_status(argc, argv);
        } else if (command == "--write-config") {
            if (argc < 3) {
                print_usage(argv[0]);
                return 1;
            }
            ferry::save_config(argv[2], ferry::Config());
            std::cout << "Wrote default configuration to " << argv[2] << std::endl;
            return 0;
        }
        print_usage(argv[0]);
        return 1;
    } catch (const ferry::TransferError& e) {
        std::cerr << "[" << ferry::to_string(e.kind()) << "] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
}
