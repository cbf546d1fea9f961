// demo_convert.cpp
//
// Prints every representation of the UUID strings given on the command line,
// or of a freshly generated v4 UUID when run without arguments:
//
//     ./demo_convert
//     ./demo_convert 8da942a4-1fbe-4ca6-852c-95c473229c7d
//     ./demo_convert dpoadk8izg9y4tte7vy1xt94o not-a-uuid
//
// Settings come from ~/.uuid25/config.toml and then ./uuid25.toml, if present.
// The [output] format decides which representation is printed first.

#include <uuid25/config.hpp>
#include <uuid25/log.hpp>
#include <uuid25/uuid25.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace uuid25;

// Missing files are fine; broken ones are reported and skipped.
static std::optional<Config> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) return std::nullopt;
    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        log::warn("%s", cfg.error().format().c_str());
        return std::nullopt;
    }
    return cfg.value();
}

static void print_all(const Uuid25& id, Format preferred) {
    std::cout << id.to_string(preferred) << "\n";
    for (Format f : {Format::Uuid25, Format::Hex, Format::Hyphenated,
                     Format::Braced, Format::Urn}) {
        std::cout << "  " << format_name(f) << ": " << id.to_string(f) << "\n";
    }
}

int main(int argc, char** argv) {
    Config cfg = Config::effective(load_layer(global_config_path()),
                                   load_layer("uuid25.toml"));
    cfg.apply();

    if (argc < 2) {
        log::debug("no input, generating a v4 UUID");
        print_all(Uuid25::gen_v4(), cfg.output_format);
        return 0;
    }

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        auto id = Uuid25::parse(argv[i]);
        if (id.is_err()) {
            log::error("'%s': %s", argv[i], id.error().message.c_str());
            ++failures;
            continue;
        }
        print_all(id.value(), cfg.output_format);
    }
    return failures == 0 ? 0 : 1;
}
