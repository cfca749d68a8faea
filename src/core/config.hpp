#pragma once

#include "core/types.hpp"
#include "mapping/color_clusterer.hpp"
#include "mapping/canonical_namer.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace hexvar {

constexpr int CONFIG_VERSION = 1;

struct ConfigScan {
    std::vector<std::string> patterns;
    std::vector<std::string> ignore;
    std::vector<std::string> exclude_dirs = {
        "node_modules", "dist", "build", "out", ".next", ".vercel", ".cache", "coverage", "target"
    };
    std::vector<std::string> extensions = {"css", "scss", "sass", "vue", "astro", "svelte"};
    bool parallel = true;
    bool progress = true;
};

struct ConfigCluster {
    float threshold = DEFAULT_CLUSTER_THRESHOLD;
};

struct ConfigNaming {
    float name_threshold = DEFAULT_NAME_THRESHOLD;
    std::string prefix = "color";
};

struct ConfigOutput {
    std::string json;
    std::string css_vars;
    std::string mapping;
    bool rewrite = false;
    bool dry_run = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigScan scan;
    ConfigCluster cluster;
    ConfigNaming naming;
    ConfigOutput output;
    bool verbose = false;

    std::string config_path;

    std::string compute_hash() const;
    bool validate(std::string& error) const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path, std::string& error);
    // nullopt with an empty error when no default file exists; a default
    // file that fails to parse or validate sets the error.
    static std::optional<Config> load_default(std::string& error);
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
