#include <iostream>
#include <string>
#include <vector>

#include "short_client.hpp"

using namespace shorten;

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --http-addr host:port [--method create|lookup] <arg>\n"
              << "Options:\n"
              << "  --http-addr ADDR   HTTP address of shortsvc\n"
              << "  --method NAME      create (default) or lookup\n"
              << "  --help, -h         Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string http_addr;
    std::string method = "create";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "--http-addr" || arg == "-http-addr") && i + 1 < argc) {
            http_addr = argv[++i];
        } else if ((arg == "--method" || arg == "-method") && i + 1 < argc) {
            method = argv[++i];
        } else if (arg.rfind("--http-addr=", 0) == 0) {
            http_addr = arg.substr(12);
        } else if (arg.rfind("--method=", 0) == 0) {
            method = arg.substr(9);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1) {
        print_usage(argv[0]);
        return 1;
    }
    if (http_addr.empty()) {
        std::cerr << "error: no remote address specified\n";
        return 1;
    }
    if (method != "create" && method != "lookup") {
        std::cerr << "error: invalid method \"" << method << "\"\n";
        return 1;
    }

    try {
        auto service = make_resilient_client(http_addr);

        if (method == "create") {
            std::cout << service->create(positional[0]).key << "\n";
        } else {
            std::cout << service->lookup(positional[0]) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
