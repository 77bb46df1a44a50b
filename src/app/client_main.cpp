/**
 * @file client_main.cpp
 * @brief Command-line client: submit tasks to a head or query its health.
 * @author Dimitris Kafetzis
 */

#include "client/head_client.hpp"
#include "network/udp_socket.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace hydramesh;

namespace {

template <typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

struct CLIArgs {
    std::string head = "127.0.0.1:7777";
    std::string payload = "hello";
    std::optional<size_t> size;
    uint32_t count = 1;
    uint32_t timeout_ms = 30000;
    bool health = false;
    bool print_output = false;
};

void print_usage() {
    std::cout << "Usage: hydramesh_client [OPTIONS]\n"
              << "  --head <host:port>   Head client-facing endpoint (default: 127.0.0.1:7777)\n"
              << "  --payload <text>     Task payload (default: hello)\n"
              << "  --size <bytes>       Send a generated payload of this size instead\n"
              << "  --count <n>          Number of tasks to submit sequentially\n"
              << "  --timeout-ms <ms>    Wait per task (default: 30000)\n"
              << "  --health             Print the head's health report and exit\n"
              << "  --print              Print result payloads as text\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--head" && has_value) {
            args.head = argv[++i];
        } else if (arg == "--payload" && has_value) {
            args.payload = argv[++i];
        } else if (arg == "--size" && has_value) {
            if (!(args.size = parse_number<size_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--count" && has_value) {
            auto n = parse_number<uint32_t>(argv[++i]);
            if (!n) return std::nullopt;
            args.count = *n;
        } else if (arg == "--timeout-ms" && has_value) {
            auto n = parse_number<uint32_t>(argv[++i]);
            if (!n) return std::nullopt;
            args.timeout_ms = *n;
        } else if (arg == "--health") {
            args.health = true;
        } else if (arg == "--print") {
            args.print_output = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 2;
    }
    auto& args = *parsed;

    auto head = parse_endpoint(args.head);
    if (!head) {
        std::cerr << head.error().message << std::endl;
        return 2;
    }

    HeadClient client(*head);
    if (auto opened = client.open(); !opened) {
        std::cerr << "Cannot open socket: " << opened.error().message << std::endl;
        return 1;
    }

    auto timeout = std::chrono::milliseconds(args.timeout_ms);

    if (args.health) {
        auto report = client.health(timeout);
        if (!report) {
            std::cerr << "health: " << to_string(report.error().code) << ": "
                      << report.error().message << std::endl;
            return 1;
        }
        std::cout << *report << std::endl;
        return 0;
    }

    std::vector<uint8_t> request;
    if (args.size) {
        request.resize(*args.size);
        for (size_t i = 0; i < request.size(); ++i) request[i] = static_cast<uint8_t>(i & 0xFF);
    } else {
        request.assign(args.payload.begin(), args.payload.end());
    }

    int failures = 0;
    for (uint32_t i = 0; i < args.count; ++i) {
        auto start = std::chrono::steady_clock::now();
        auto result = client.submit(request, timeout);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            ++failures;
            std::cerr << "task " << (i + 1) << ": " << to_string(result.error().code) << ": "
                      << result.error().message << " (" << elapsed.count() << "ms)" << std::endl;
            continue;
        }

        std::cout << "task " << (i + 1) << ": " << result->size() << " bytes in "
                  << elapsed.count() << "ms" << std::endl;
        if (args.print_output) {
            std::cout << std::string(result->begin(), result->end()) << std::endl;
        }
    }

    return failures == 0 ? 0 : 1;
}
