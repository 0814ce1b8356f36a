#include "config.hpp"
#include "mcp_server.hpp"
#include "tool.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

static void print_usage() {
    std::cout << "Usage: mcp-collaborator [options]\n"
              << "\n"
              << "Serves text-file editing and git tools over MCP (JSON-RPC on stdin/stdout).\n"
              << "\n"
              << "Options:\n"
              << "  -r, --repository PATH  Git repository cloned by git_checkout\n"
              << "  -c, --checkouts PATH   Root directory for per-client checkouts\n"
              << "  -v, --version          Print version and exit\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Configuration is read from ~/.mcp-collaborator/config.json.\n"
              << "\n"
              << "Environment variables:\n"
              << "  COLLAB_REPOSITORY      Overrides 'repository' from the config file\n"
              << "  COLLAB_CHECKOUTS       Overrides 'checkouts' from the config file\n";
}

int main(int argc, char* argv[]) {
    std::string repository_arg;
    std::string checkouts_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-r" || arg == "--repository") && i + 1 < argc) {
            repository_arg = argv[++i];
        } else if ((arg == "-c" || arg == "--checkouts") && i + 1 < argc) {
            checkouts_arg = argv[++i];
        } else if (arg == "-v" || arg == "--version") {
            std::cout << collab::kServerName << " " << collab::kServerVersion << "\n";
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    collab::Config config = collab::Config::load();
    if (!repository_arg.empty()) config.repository = repository_arg;
    if (!checkouts_arg.empty()) config.checkouts = checkouts_arg;

    if (config.checkouts.empty()) {
        std::cerr << "Error: no checkouts directory configured (use --checkouts or COLLAB_CHECKOUTS)\n";
        return 1;
    }
    if (config.repository.empty()) {
        std::cerr << "[server] Warning: no repository configured, git_checkout will fail\n";
    }

    std::error_code ec;
    std::filesystem::create_directories(config.checkouts, ec);
    if (ec) {
        std::cerr << "Error: cannot create checkouts directory " << config.checkouts
                  << ": " << ec.message() << "\n";
        return 1;
    }

    collab::ToolContext context{
        collab::Workspace(config.repository, config.checkouts),
        collab::RangeEditor(config.editor_options()),
        config.default_encoding(),
        config.git.binary,
        config.git.auto_stage
    };

    collab::McpServer server(collab::create_builtin_tools(context));
    std::cerr << "[server] Starting " << collab::kServerName << " v"
              << collab::kServerVersion << " (checkouts: " << config.checkouts << ")\n";

    server.run(std::cin, std::cout);
    return 0;
}
