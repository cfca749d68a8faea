#pragma once

#include "core/types.hpp"
#include "core/color_space.hpp"
#include <vector>
#include <cstdint>

namespace hexvar {

constexpr float DEFAULT_CLUSTER_THRESHOLD = 10.0f;

struct ColorCluster {
    HexColor representative;
    Lab lab;
    std::vector<ObservedColor> members;

    uint64_t total_count() const;
    bool contains(const HexColor& hex) const;
};

class ColorClusterer {
public:
    struct Config {
        float threshold = DEFAULT_CLUSTER_THRESHOLD;
    };

    ColorClusterer() : ColorClusterer(Config{}) {}
    explicit ColorClusterer(const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Greedy first-match grouping. Colors are visited by descending count,
    // ties in ColorCounts insertion order; each joins the first existing
    // cluster (creation order) whose representative is closer than the
    // threshold and shares its alpha, otherwise opens a new cluster.
    std::vector<ColorCluster> cluster(const ColorCounts& counts) const;

    static std::vector<ObservedColor> visit_order(const ColorCounts& counts);
    static Result validate_threshold(float threshold);

private:
    Config config_;
};

}
