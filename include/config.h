#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <toml++/toml.h>   // required, no forward declaration possible


template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key '" + std::string(key) + "'");
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for '" + std::string(key) + "'");
    }
    return *value;
}

static inline const toml::table &require_table(const toml::table &tbl, std::string_view name) {
    const auto *node = tbl.get(name);
    if (!node) {
        throw std::runtime_error("missing [" + std::string(name) + "] table");
    }
    const auto *t = node->as_table();
    if (!t) {
        throw std::runtime_error("invalid [" + std::string(name) + "] table");
    }
    return *t;
}


struct LoggingConfig {
    bool capture_logger = true;       // stream connect / EOS / errors
    bool trigger_logger = true;       // fired scares, pause/resume
    bool audio_logger = true;         // clip loading and playback
    bool ui_logger = true;            // key presses, stats polling
    bool frame_error_logger = true;   // dropped frames
};

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);
