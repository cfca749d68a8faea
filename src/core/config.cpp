#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml.hpp>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
    #include <windows.h>
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace hexvar {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

uint32_t hash_combine(uint32_t a, uint32_t b) {
    a ^= b + 0x9e3779b9 + (a << 6) + (a >> 2);
    return a;
}

uint32_t hash_string(const std::string& s) {
    uint32_t h = 0;
    for (char c : s) {
        h = hash_combine(h, static_cast<uint32_t>(c));
    }
    return h;
}

uint32_t hash_strings(const std::vector<std::string>& v) {
    uint32_t h = static_cast<uint32_t>(v.size());
    for (const auto& s : v) {
        h = hash_combine(h, hash_string(s));
    }
    return h;
}

uint32_t hash_float(float f) {
    uint32_t u;
    std::memcpy(&u, &f, sizeof(f));
    return u;
}

uint32_t hash_int(int i) {
    return static_cast<uint32_t>(i);
}

void read_string_array(const toml::node_view<toml::node>& node, std::vector<std::string>& out) {
    if (auto arr = node.as_array()) {
        out.clear();
        for (auto& el : *arr) {
            if (auto v = el.value<std::string>()) out.push_back(*v);
        }
    }
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/hexvar";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (!std::isfinite(cluster.threshold) || cluster.threshold < 0.0f) {
        error = "cluster.threshold must be a finite number >= 0";
        return false;
    }
    if (!std::isfinite(naming.name_threshold) || naming.name_threshold < 0.0f) {
        error = "naming.name_threshold must be a finite number >= 0";
        return false;
    }
    if (!CanonicalNamer::is_valid_prefix(naming.prefix)) {
        error = "naming.prefix must start with a letter and use only lowercase letters, digits and hyphens";
        return false;
    }
    if (scan.extensions.empty()) {
        error = "scan.extensions must list at least one extension";
        return false;
    }
    for (const auto& ext : scan.extensions) {
        if (ext.empty() || ext[0] == '.') {
            error = "scan.extensions entries are bare extensions such as \"css\"";
            return false;
        }
    }
    if (output.dry_run && !output.rewrite) {
        error = "output.dry_run requires output.rewrite";
        return false;
    }
    return true;
}

std::string Config::compute_hash() const {
    uint32_t h = 0;

    h = hash_combine(h, hash_int(version));
    h = hash_combine(h, hash_strings(scan.patterns));
    h = hash_combine(h, hash_strings(scan.ignore));
    h = hash_combine(h, hash_strings(scan.exclude_dirs));
    h = hash_combine(h, hash_strings(scan.extensions));
    h = hash_combine(h, hash_float(cluster.threshold));
    h = hash_combine(h, hash_float(naming.name_threshold));
    h = hash_combine(h, hash_string(naming.prefix));

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << h;
    return ss.str();
}

std::optional<Config> Config::load(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        error = "config file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                error = "unsupported config_version " + std::to_string(*v);
                return std::nullopt;
            }
        }

        if (auto scan = tbl["scan"]) {
            read_string_array(scan["patterns"], cfg.scan.patterns);
            read_string_array(scan["ignore"], cfg.scan.ignore);
            read_string_array(scan["exclude_dirs"], cfg.scan.exclude_dirs);
            read_string_array(scan["extensions"], cfg.scan.extensions);
            if (auto v = scan["parallel"].value<bool>()) cfg.scan.parallel = *v;
            if (auto v = scan["progress"].value<bool>()) cfg.scan.progress = *v;
        }

        if (auto cluster = tbl["cluster"]) {
            if (auto v = cluster["threshold"].value<double>()) cfg.cluster.threshold = static_cast<float>(*v);
        }

        if (auto naming = tbl["naming"]) {
            if (auto v = naming["name_threshold"].value<double>()) cfg.naming.name_threshold = static_cast<float>(*v);
            if (auto v = naming["prefix"].value<std::string>()) cfg.naming.prefix = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["json"].value<std::string>()) cfg.output.json = *v;
            if (auto v = output["css_vars"].value<std::string>()) cfg.output.css_vars = *v;
            if (auto v = output["mapping"].value<std::string>()) cfg.output.mapping = *v;
            if (auto v = output["rewrite"].value<bool>()) cfg.output.rewrite = *v;
            if (auto v = output["dry_run"].value<bool>()) cfg.output.dry_run = *v;
        }

        if (auto v = tbl["verbose"].value<bool>()) cfg.verbose = *v;

        if (!cfg.validate(error)) {
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << path << ":" << e.source().begin.line << ": " << e.description();
        error = ss.str();
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default(std::string& error) {
    error.clear();
    std::string path = default_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec)) {
        return std::nullopt;
    }
    return load(path, error);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config defaults = Config::defaults();

    if (!override.scan.patterns.empty()) result.scan.patterns = override.scan.patterns;
    if (!override.scan.ignore.empty()) result.scan.ignore = override.scan.ignore;
    if (override.scan.exclude_dirs != defaults.scan.exclude_dirs)
        result.scan.exclude_dirs = override.scan.exclude_dirs;
    if (override.scan.extensions != defaults.scan.extensions)
        result.scan.extensions = override.scan.extensions;
    result.scan.parallel = override.scan.parallel;
    result.scan.progress = override.scan.progress;

    if (override.cluster.threshold != defaults.cluster.threshold)
        result.cluster.threshold = override.cluster.threshold;

    if (override.naming.name_threshold != defaults.naming.name_threshold)
        result.naming.name_threshold = override.naming.name_threshold;
    if (override.naming.prefix != defaults.naming.prefix)
        result.naming.prefix = override.naming.prefix;

    if (!override.output.json.empty()) result.output.json = override.output.json;
    if (!override.output.css_vars.empty()) result.output.css_vars = override.output.css_vars;
    if (!override.output.mapping.empty()) result.output.mapping = override.output.mapping;
    result.output.rewrite = result.output.rewrite || override.output.rewrite;
    result.output.dry_run = result.output.dry_run || override.output.dry_run;

    result.verbose = result.verbose || override.verbose;
    if (!override.config_path.empty()) result.config_path = override.config_path;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.patterns.empty()) config.scan.patterns = args.patterns;
    for (const auto& ig : args.ignore) {
        config.scan.ignore.push_back(ig);
    }
    if (args.no_parallel) config.scan.parallel = false;
    if (args.no_progress) config.scan.progress = false;

    if (args.threshold_set) config.cluster.threshold = args.threshold;
    if (args.name_threshold_set) config.naming.name_threshold = args.name_threshold;
    if (!args.prefix.empty()) config.naming.prefix = args.prefix;

    if (!args.out.empty()) config.output.json = args.out;
    if (!args.css_vars.empty()) config.output.css_vars = args.css_vars;
    if (!args.mapping.empty()) config.output.mapping = args.mapping;
    if (args.rewrite) config.output.rewrite = true;
    if (args.dry_run) {
        config.output.rewrite = true;
        config.output.dry_run = true;
    }

    if (args.verbose) config.verbose = true;

    return config;
}

}
