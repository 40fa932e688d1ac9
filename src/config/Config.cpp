#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace hs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["completion"]) YAML::convert<CompletionConfig>::decode(node, cfg.completion);
    if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
    if (auto node = root["repl"]) YAML::convert<ReplConfig>::decode(node, cfg.repl);

    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["logging"] = cfg.logging;
    root["completion"] = cfg.completion;
    root["remote"] = cfg.remote;
    root["repl"] = cfg.repl;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
