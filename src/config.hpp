#pragma once
#include "range_editor.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace collab {

struct EditorConfig {
    std::string line_ending = "detect";     // detect | lf | crlf
    std::string default_encoding = "utf-8";
    uint64_t max_file_size = 10 * 1024 * 1024;
    bool require_hash = false;
    bool create_directories = true;
};

struct GitConfig {
    bool auto_stage = true;  // git add files after every successful edit
    std::string binary = "git";
};

struct Config {
    std::string repository;  // upstream repository cloned by git_checkout
    std::string checkouts;   // root directory of per-client checkouts

    EditorConfig editor;
    GitConfig git;

    // Load from ~/.mcp-collaborator/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Path of the config file (~ expanded)
    static std::string config_path();

    // Editor options; invalid names fall back to the defaults with a warning
    EditorOptions editor_options() const;
    Encoding default_encoding() const;
};

} // namespace collab
