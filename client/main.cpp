#include <string>
#include <iostream>
#include <sstream>
#include <vector>
#include "fslite_client.hpp"
#include "config.hpp"
#include <grpcpp/grpcpp.h>

std::vector<std::string> ParseCommand(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string s;
    while (iss >> s) {
        tokens.push_back(s);
    }
    return tokens;
}

void RunClient(const std::string& address, int maxMessageMb) {
    int maxMessageBytes = maxMessageMb * 1024 * 1024;

    grpc::ChannelArguments args;
    args.SetMaxSendMessageSize(maxMessageBytes);
    args.SetMaxReceiveMessageSize(maxMessageBytes);

    std::shared_ptr<grpc::ChannelInterface> channel{
        grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(), args)
    };

    FsLiteClient client{channel, maxMessageBytes};

    std::cout << "FS-Lite Client Started\n";
    std::cout << "Commands:\n";
    std::cout << "  upload <path>\n";
    std::cout << "  reconstruct <fileId>\n";
    std::cout << "  download <fileId> <outputPath>\n";
    std::cout << "  nodes\n";
    std::cout << "  online|offline|toggle <nodeId>\n";
    std::cout << "  files\n";
    std::cout << "  dashboard\n";
    std::cout << "  logs [limit]\n";
    std::cout << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        auto tokens = ParseCommand(line);
        if (tokens.empty()) continue;

        const std::string& cmd = tokens[0];

        if (cmd == "exit") {
            break;
        } else if (cmd == "upload" && tokens.size() == 2) {
            client.UploadFile(tokens[1]);
        } else if (cmd == "reconstruct" && tokens.size() == 2) {
            client.ReconstructFile(tokens[1]);
        } else if (cmd == "download" && tokens.size() == 3) {
            client.DownloadFile(tokens[1], tokens[2]);
        } else if (cmd == "nodes" && tokens.size() == 1) {
            client.ShowNodes();
        } else if ((cmd == "online" || cmd == "offline") && tokens.size() == 2) {
            client.SetNodeStatus(tokens[1], cmd);
        } else if (cmd == "toggle" && tokens.size() == 2) {
            client.SetNodeStatus(tokens[1], "");
        } else if (cmd == "files" && tokens.size() == 1) {
            client.ShowFiles();
        } else if (cmd == "dashboard" && tokens.size() == 1) {
            client.ShowDashboard();
        } else if (cmd == "logs" && tokens.size() <= 2) {
            uint32_t limit = 20;
            if (tokens.size() == 2) {
                try {
                    limit = static_cast<uint32_t>(std::stoul(tokens[1]));
                } catch (const std::exception&) {
                    std::cout << "[ERROR] Invalid limit: " << tokens[1] << "\n";
                    continue;
                }
            }
            client.ShowEvents(limit);
        } else {
            std::cout << "[ERROR] Invalid command.\n";
        }
    }
}

int main(int argc, char* argv[]) {
    std::string server_addr = "localhost:50051";
    int max_message_mb = 64;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--server-addr" && i + 1 < argc) {
            server_addr = argv[++i];
        } else if (arg == "--max-message-mb" && i + 1 < argc) {
            try {
                max_message_mb = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                max_message_mb = 0;
            }
            if (max_message_mb <= 0 || max_message_mb > kMaxMessageMb) {
                std::cerr << "[ERROR] --max-message-mb expects a number between 1 and "
                          << kMaxMessageMb << "\n";
                return 1;
            }
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --server-addr <addr>      FS-Lite server address (default: localhost:50051)\n"
                      << "  --max-message-mb <n>      Largest gRPC message in MB (default: 64)\n"
                      << "  --help                    Show this help message\n";
            return 0;
        }
    }

    RunClient(server_addr, max_message_mb);
    return 0;
}
