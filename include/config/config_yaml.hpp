#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace hs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["shell"]      = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["completion"] = to_std_string(spdlog::level::to_string_view(rhs.completion));
        node["remote"]     = to_std_string(spdlog::level::to_string_view(rhs.remote));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("info"));
        rhs.completion = spdlog::level::from_str(node["completion"].as<std::string>("warn"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

template<>
struct convert<CompletionConfig> {
    static Node encode(const CompletionConfig& rhs) {
        Node node;
        node["value_callbacks"] = rhs.value_callbacks;
        return node;
    }

    static bool decode(const Node& node, CompletionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.value_callbacks = node["value_callbacks"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.user_agent = node["user_agent"].as<std::string>("hubsh");
        return true;
    }
};

template<>
struct convert<ReplConfig> {
    static Node encode(const ReplConfig& rhs) {
        Node node;
        node["prompt"] = rhs.prompt;
        node["history_file"] = rhs.history_file.string();
        return node;
    }

    static bool decode(const Node& node, ReplConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.prompt = node["prompt"].as<std::string>("hubsh> ");
        rhs.history_file = node["history_file"].as<std::string>("");
        return true;
    }
};

}
