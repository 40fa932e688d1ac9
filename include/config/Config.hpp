#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace hs::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum shell      = spdlog::level::info;   // Registration, dispatch, command resolution
    spdlog::level::level_enum completion = spdlog::level::warn;   // Per-keystroke; very chatty at debug/trace
    spdlog::level::level_enum remote     = spdlog::level::info;   // http:// and file:// value substitution
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct CompletionConfig {
    bool value_callbacks = true;    // false: never call per-option autocomplete functions
};

struct RemoteConfig {
    bool enabled = true;            // false: http:// and file:// values are passed through verbatim
    unsigned int timeout_seconds = 30;
    std::string user_agent = "hubsh";
};

struct ReplConfig {
    std::string prompt = "hubsh> ";
    std::filesystem::path history_file;  // empty: history is not persisted
};

struct Config {
    LoggingConfig logging;
    CompletionConfig completion;
    RemoteConfig remote;
    ReplConfig repl;
};

Config loadConfig(const std::filesystem::path& path);
std::string dumpConfig(const Config& cfg);

}
