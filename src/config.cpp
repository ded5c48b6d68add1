#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace memkeep {

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"path", "memories.db"}
        }},
        {"server", {
            {"name", "Memory Manager"},
            {"version", "0.1.0"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    return load_from(expand_home("~/.memkeep/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            if (!original.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            j = merge_defaults(original, defaults_json());
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("path") && m["path"].is_string())
            cfg.memory.path = m["path"].get<std::string>();
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("name") && s["name"].is_string())
            cfg.server.name = s["name"].get<std::string>();
        if (s.contains("version") && s["version"].is_string())
            cfg.server.version = s["version"].get<std::string>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("MEMKEEP_DB_PATH")) {
        if (*v) cfg.memory.path = v;
    }

    return cfg;
}

std::string Config::db_path() const {
    return expand_home(memory.path);
}

} // namespace memkeep
