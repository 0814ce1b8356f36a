#include "config.hpp"
#include "file_io.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace collab {

nlohmann::json Config::defaults_json() {
    return {
        {"repository", ""},
        {"checkouts", ""},
        {"editor", {
            {"line_ending", "detect"},
            {"default_encoding", "utf-8"},
            {"max_file_size", 10 * 1024 * 1024},
            {"require_hash", false},
            {"create_directories", true}
        }},
        {"git", {
            {"auto_stage", true},
            {"binary", "git"}
        }}
    };
}

std::string Config::config_path() {
    return expand_home("~/.mcp-collaborator/config.json");
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
    Config cfg;

    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) throw std::runtime_error("config root is not an object");
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    if (j.contains("repository") && j["repository"].is_string())
        cfg.repository = expand_home(j["repository"].get<std::string>());
    if (j.contains("checkouts") && j["checkouts"].is_string())
        cfg.checkouts = expand_home(j["checkouts"].get<std::string>());

    if (j.contains("editor") && j["editor"].is_object()) {
        auto& e = j["editor"];
        if (e.contains("line_ending") && e["line_ending"].is_string())
            cfg.editor.line_ending = e["line_ending"].get<std::string>();
        if (e.contains("default_encoding") && e["default_encoding"].is_string())
            cfg.editor.default_encoding = e["default_encoding"].get<std::string>();
        if (e.contains("max_file_size") && e["max_file_size"].is_number_integer() &&
            e["max_file_size"].get<int64_t>() > 0)
            cfg.editor.max_file_size = e["max_file_size"].get<uint64_t>();
        if (e.contains("require_hash") && e["require_hash"].is_boolean())
            cfg.editor.require_hash = e["require_hash"].get<bool>();
        if (e.contains("create_directories") && e["create_directories"].is_boolean())
            cfg.editor.create_directories = e["create_directories"].get<bool>();
    }

    if (j.contains("git") && j["git"].is_object()) {
        auto& g = j["git"];
        if (g.contains("auto_stage") && g["auto_stage"].is_boolean())
            cfg.git.auto_stage = g["auto_stage"].get<bool>();
        if (g.contains("binary") && g["binary"].is_string())
            cfg.git.binary = g["binary"].get<std::string>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("COLLAB_REPOSITORY"))
        cfg.repository = v;
    if (const char* v = std::getenv("COLLAB_CHECKOUTS"))
        cfg.checkouts = v;

    return cfg;
}

EditorOptions Config::editor_options() const {
    EditorOptions opts;
    if (auto policy = parse_line_ending_policy(editor.line_ending)) {
        opts.line_ending = *policy;
    } else {
        std::cerr << "[config] Unknown editor.line_ending '" << editor.line_ending
                  << "', using detect\n";
    }
    opts.max_file_size = static_cast<size_t>(editor.max_file_size);
    opts.require_hash = editor.require_hash;
    opts.create_directories = editor.create_directories;
    return opts;
}

Encoding Config::default_encoding() const {
    if (auto enc = parse_encoding(editor.default_encoding)) return *enc;
    std::cerr << "[config] Unknown editor.default_encoding '" << editor.default_encoding
              << "', using utf-8\n";
    return Encoding::Utf8;
}

} // namespace collab
