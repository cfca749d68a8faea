#pragma once

#include "core/types.hpp"
#include "mapping/color_clusterer.hpp"
#include "mapping/named_colors.hpp"
#include <string>
#include <vector>
#include <unordered_set>

namespace hexvar {

constexpr float DEFAULT_NAME_THRESHOLD = 2.3f;

struct NamedCluster {
    std::string identifier;
    std::string color_name;     // empty when the identifier is hex-derived
    ColorCluster cluster;

    std::string custom_property() const { return "--" + identifier; }
    std::string replacement() const { return "var(" + custom_property() + ")"; }
};

class CanonicalNamer {
public:
    struct Config {
        float name_threshold = DEFAULT_NAME_THRESHOLD;
        std::string prefix = "color";
    };

    explicit CanonicalNamer(const NamedColorTable& table) : CanonicalNamer(table, Config{}) {}
    CanonicalNamer(const NamedColorTable& table, const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    std::vector<NamedCluster> name(const std::vector<ColorCluster>& clusters) const;

    // Identifier for one cluster before collision handling.
    std::string base_identifier(const ColorCluster& cluster, std::string* color_name = nullptr) const;

    static std::string slugify(const std::string& text);
    static bool is_valid_prefix(const std::string& prefix);

private:
    const NamedColorTable& table_;
    Config config_;

    static std::string make_unique(const std::string& base, std::unordered_set<std::string>& taken);
};

}
