#include "config.hpp"
#include "mcp_server.hpp"
#include "memory.hpp"
#include "memory/sqlite_memory.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cerr << "Usage: memkeep [options]\n"
              << "\n"
              << "Serves a persistent memory store over the Model Context Protocol (stdio).\n"
              << "\n"
              << "Options:\n"
              << "  --db PATH            SQLite database file (default: memories.db)\n"
              << "  --config PATH        Config file (default: ~/.memkeep/config.json)\n"
              << "  --version            Print version and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  MEMKEEP_DB_PATH      Database path (overridden by --db)\n";
}

static void install_signal_handlers() {
    // No SA_RESTART: a read blocked on stdin returns so the loop can exit.
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int main(int argc, char* argv[]) try {
    std::string db_path;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "memkeep " << memkeep::ServerConfig{}.version << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? memkeep::Config::load()
                                      : memkeep::Config::load_from(config_path);
    if (!db_path.empty()) {
        config.memory.path = db_path;
    }

    // stdout carries the protocol; everything human-readable goes to stderr
    std::cerr << "Starting " << config.server.name << " MCP Server...\n"
              << "This server allows you to store and retrieve memories and ideas.\n";

    memkeep::SqliteMemory memory(config.db_path());
    try {
        memory.open();
    } catch (const memkeep::StoreError& e) {
        std::cerr << "[memkeep] Cannot open memory store " << memory.path()
                  << ": " << e.what() << "\n";
        return 1;
    }
    std::cerr << "[memkeep] Using " << memory.backend_name() << " database " << memory.path() << "\n";

    install_signal_handlers();

    memkeep::McpServer server(memory, config.server);
    server.set_abort_flag(&g_shutdown);
    server.run(std::cin, std::cout);

    if (g_shutdown.load()) {
        std::cerr << "\nServer stopped.\n";
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
