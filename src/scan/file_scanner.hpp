#pragma once

#include "core/types.hpp"
#include <ostream>
#include <regex>
#include <string>
#include <vector>

namespace hexvar {

// "#" followed by 8, 6 or 3 hex digits, not running into a further hex digit.
const std::regex& hex_literal_regex();

struct LiteralMatch {
    size_t position = 0;
    size_t length = 0;
};

// Regex matches that stand alone as color values. A match glued to an
// identifier (#add-button), an HTML entity (&#169;), a selector followed by
// '{', or a URL attribute value (href="#top") is not a color.
std::vector<LiteralMatch> find_hex_literals(const std::string& text);

std::string glob_to_regex(const std::string& pattern);

class FileScanner {
public:
    struct Config {
        std::vector<std::string> patterns;
        std::vector<std::string> ignore;
        std::vector<std::string> exclude_dirs = {
            "node_modules", "dist", "build", "out", ".next", ".vercel", ".cache", "coverage", "target"
        };
        std::vector<std::string> extensions = {"css", "scss", "sass", "vue", "astro", "svelte"};
        bool parallel = true;
        std::ostream* progress = nullptr;   // "Scanning files: i/n" lines when set
    };

    struct ScanResult {
        std::vector<std::string> files;
        std::vector<std::string> unreadable;
        ColorCounts counts;
    };

    FileScanner() : FileScanner(Config{}) {}
    explicit FileScanner(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Matching files in a fixed order: patterns in the given order, each
    // pattern's matches sorted by path, duplicates dropped.
    std::vector<std::string> discover() const;

    ScanResult scan() const;
    ScanResult scan_files(const std::vector<std::string>& files) const;

    static std::vector<HexColor> extract(const std::string& text);

    bool is_excluded(const std::string& path) const;
    bool has_allowed_extension(const std::string& path) const;

private:
    Config config_;

    void expand_pattern(const std::string& pattern, std::vector<std::string>& out) const;
};

}
