#pragma once

#include "core/types.hpp"
#include "mapping/color_clusterer.hpp"
#include "mapping/canonical_namer.hpp"
#include "mapping/named_colors.hpp"
#include "render/artifact_builder.hpp"
#include <string>
#include <utility>
#include <vector>

namespace hexvar {

class Pipeline {
public:
    struct Config {
        float threshold = DEFAULT_CLUSTER_THRESHOLD;
        float name_threshold = DEFAULT_NAME_THRESHOLD;
        std::string prefix = "color";
    };

    explicit Pipeline(const NamedColorTable& table) : Pipeline(table, Config{}) {}
    Pipeline(const NamedColorTable& table, const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    struct Output {
        std::vector<NamedCluster> clusters;
        Artifacts artifacts;
    };

    // counts -> clusters -> names -> artifacts. On failure `out` is left empty.
    Result process(const ColorCounts& counts, Output& out) const;

    // Raw literal -> count pairs in first-seen order; spellings of the same
    // color are merged. A malformed literal fails the whole run.
    Result process(const std::vector<std::pair<std::string, uint64_t>>& literals, Output& out) const;

    Result validate() const;

private:
    const NamedColorTable& table_;
    Config config_;
};

}
