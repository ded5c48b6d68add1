#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace memkeep {

struct MemoryConfig {
    std::string path = "memories.db";
};

struct ServerConfig {
    std::string name = "Memory Manager";
    std::string version = "0.1.0";
};

struct Config {
    MemoryConfig memory;
    ServerConfig server;

    // Load from ~/.memkeep/config.json + env vars
    static Config load();

    // Load from an explicit file + env vars. A missing or malformed file
    // falls back to defaults.
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Database path with ~ expanded
    std::string db_path() const;
};

} // namespace memkeep
