/**
 * @file sftp_cli.cpp
 * @brief Command line SFTP client example
 *
 * This example demonstrates how to:
 * - Build and connect an sftp_client
 * - Upload and download files with progress output
 * - List, create, rename and remove remote items
 * - Handle errors returned through futures
 *
 * The "demo" command runs the same calls against an in-memory server, so it
 * works without an SSH server or libssh2.
 */

#include <async_sftp/async_sftp.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace async_sftp;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <host[:port]> <user> <password> <command> [args]"
              << std::endl;
    std::cout << "       " << program << " demo" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  ls <remote_dir>" << std::endl;
    std::cout << "  stat <remote_path>" << std::endl;
    std::cout << "  mkdir <remote_dir>" << std::endl;
    std::cout << "  rmdir <remote_dir>" << std::endl;
    std::cout << "  rm <remote_file>" << std::endl;
    std::cout << "  mv <old_path> <new_path>" << std::endl;
    std::cout << "  get <remote_file> <local_file>" << std::endl;
    std::cout << "  put <local_file> <remote_file>" << std::endl;
}

std::pair<std::string, uint16_t> parse_endpoint(const std::string& addr) {
    auto colon_pos = addr.find(':');
    if (colon_pos == std::string::npos) {
        return {addr, default_sftp_port};
    }
    return {
        addr.substr(0, colon_pos),
        static_cast<uint16_t>(std::stoi(addr.substr(colon_pos + 1)))
    };
}

void print_entry(const file_metadata& entry) {
    auto modified = std::chrono::system_clock::to_time_t(entry.modified_at);
    std::cout << entry.permission_string() << " "
              << std::setw(10) << entry.size << " "
              << std::put_time(std::gmtime(&modified), "%Y-%m-%d %H:%M") << " "
              << entry.name << std::endl;
}

auto print_progress() -> progress_callback {
    return [](uint64_t done, uint64_t total) {
        auto percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
        std::cout << "\r[Progress] " << percent << "% (" << done << "/" << total << " bytes)"
                  << std::flush;
        if (done == total) {
            std::cout << std::endl;
        }
        return true;
    };
}

template <typename T>
auto report(const result<T>& outcome) -> bool {
    if (!outcome) {
        std::cerr << "[Error] " << outcome.error().message << std::endl;
        return false;
    }
    return true;
}

auto run_command(sftp_client& client, const std::vector<std::string>& args) -> int {
    const auto& command = args[0];

    if (command == "ls" && args.size() >= 2) {
        auto listed = client.list_files(args[1]).get();
        if (!report(listed)) return 1;
        for (const auto& entry : listed.value()) {
            print_entry(entry);
        }
        return 0;
    }
    if (command == "stat" && args.size() >= 2) {
        auto info = client.stat(args[1]).get();
        if (!report(info)) return 1;
        print_entry(info.value());
        return 0;
    }
    if (command == "mkdir" && args.size() >= 2) {
        auto made = client.make_directory(args[1]).get();
        if (!report(made)) return 1;
        print_entry(made.value());
        return 0;
    }
    if (command == "rmdir" && args.size() >= 2) {
        return report(client.remove_directory(args[1]).get()) ? 0 : 1;
    }
    if (command == "rm" && args.size() >= 2) {
        return report(client.remove_file(args[1]).get()) ? 0 : 1;
    }
    if (command == "mv" && args.size() >= 3) {
        auto renamed = client.rename(args[1], args[2]).get();
        if (!report(renamed)) return 1;
        print_entry(renamed.value());
        return 0;
    }
    if (command == "get" && args.size() >= 3) {
        auto downloaded = client.download(args[1], args[2], print_progress()).get();
        if (!report(downloaded)) return 1;
        std::cout << "[Complete] " << downloaded.value().bytes_transferred << " bytes in "
                  << downloaded.value().duration().count() << " ms" << std::endl;
        return 0;
    }
    if (command == "put" && args.size() >= 3) {
        auto uploaded = client.upload(args[2], args[1], print_progress()).get();
        if (!report(uploaded)) return 1;
        std::cout << "[Complete] " << uploaded.value().bytes_transferred << " bytes in "
                  << uploaded.value().duration().count() << " ms" << std::endl;
        return 0;
    }

    std::cerr << "Unknown command or missing arguments: " << command << std::endl;
    return 1;
}

int run_demo() {
    auto remote = std::make_shared<memory_filesystem>();
    remote->add_file("/home/demo/readme.txt", std::string_view("Hello from the demo server\n"));

    auto client_result = sftp_client::builder()
        .with_host("demo.local")
        .with_credentials("user", "password")
        .with_chunk_size(4 * 1024)
        .with_session(std::make_unique<memory_session>(remote))
        .build();
    if (!client_result) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    if (!report(client.connect().get())) return 1;

    auto local = std::filesystem::temp_directory_path() / "async_sftp_demo.bin";
    {
        std::ofstream file(local, std::ios::binary);
        std::vector<char> data(64 * 1024);
        for (std::size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<char>('A' + (i % 26));
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    int status = 0;
    std::vector<std::vector<std::string>> script = {
        {"mkdir", "/home/demo/uploads"},
        {"put", local.string(), "/home/demo/uploads/data.bin"},
        {"mv", "/home/demo/uploads/data.bin", "/home/demo/uploads/renamed.bin"},
        {"ls", "/home/demo/uploads"},
        {"get", "/home/demo/readme.txt", local.string()},
        {"rm", "/home/demo/uploads/renamed.bin"},
        {"rmdir", "/home/demo/uploads"},
        {"ls", "/home/demo"},
    };
    for (const auto& step : script) {
        std::cout << "> " << step[0] << std::endl;
        if (run_command(client, step) != 0) {
            status = 1;
            break;
        }
    }

    client.disconnect();
    std::error_code ec;
    std::filesystem::remove(local, ec);
    return status;
}

int main(int argc, char* argv[]) {
    if (argc == 2 && std::string(argv[1]) == "demo") {
        return run_demo();
    }
    if (argc < 5) {
        print_usage(argv[0]);
        return 1;
    }

    auto [host, port] = parse_endpoint(argv[1]);

    auto client_result = sftp_client::builder()
        .with_host(host)
        .with_port(port)
        .with_credentials(argv[2], argv[3])
        .with_connect_timeout(std::chrono::seconds(10))
        .build();

    if (!client_result) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::cout << "[Connection] Connecting to " << host << ":" << port << std::endl;
    if (!report(client.connect().get())) {
        return 1;
    }
    std::cout << "[Connection] " << to_string(client.state()) << std::endl;

    std::vector<std::string> args(argv + 4, argv + argc);
    int status = run_command(client, args);

    client.disconnect();
    return status;
}
