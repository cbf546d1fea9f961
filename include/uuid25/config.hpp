#pragma once

#include <uuid25/format.hpp>
#include <uuid25/log.hpp>
#include <uuid25/result.hpp>
#include <optional>
#include <string>

namespace uuid25 {

// Layered configuration: global < local (local wins).
//
//   [log]
//   level = "debug"
//   color = false
//
//   [output]
//   format = "hyphenated"
struct Config {
    log::Level log_level = log::Info;
    bool color = false;
    Format output_format = Format::Uuid25;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;
    bool output_format_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Push the logging settings into uuid25::log. Color is only touched when
    // set; otherwise the logger keeps auto-detecting a terminal.
    void apply() const;

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.uuid25/config.toml, or empty if no home directory is known.
std::string global_config_path();

} // namespace uuid25
