#include <uuid25/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace uuid25 {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return Uuid25Error{Uuid25Error::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        for (const auto& [key, val] : *lg) {
            std::string k(key);
            if (k == "level") {
                auto s = val.value<std::string>();
                if (!s || !log::parse_level_name(*s, cfg.log_level)) {
                    return Uuid25Error{Uuid25Error::Config,
                        "invalid log level in [log]",
                        "expected one of: trace, debug, info, warn, error"};
                }
                cfg.log_level_set = true;
            } else if (k == "color") {
                auto b = val.value<bool>();
                if (!b) {
                    return Uuid25Error{Uuid25Error::Config,
                        "[log] color must be a boolean"};
                }
                cfg.color = *b;
                cfg.color_set = true;
            } else {
                log::warn("ignoring unknown config key 'log.%s'", k.c_str());
            }
        }
    }

    // [output] section
    if (auto out = doc["output"].as_table()) {
        for (const auto& [key, val] : *out) {
            std::string k(key);
            if (k == "format") {
                auto s = val.value<std::string>();
                if (!s) {
                    return Uuid25Error{Uuid25Error::Config,
                        "[output] format must be a string"};
                }
                auto f = parse_format_name(*s);
                UUID25_TRY(f);
                cfg.output_format = f.value();
                cfg.output_format_set = true;
            } else {
                log::warn("ignoring unknown config key 'output.%s'", k.c_str());
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Uuid25Error{Uuid25Error::IO,
            "cannot open config file: " + path};
    }
    log::debug("loading config %s", path.c_str());
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.output_format_set) {
        output_format = other.output_format;
        output_format_set = true;
    }
}

void Config::apply() const {
    log::set_level(log_level);
    if (color_set) {
        log::set_color_enabled(color);
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.uuid25/config.toml";
}

} // namespace uuid25
