#include "core/pipeline.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace hexvar {

Pipeline::Pipeline(const NamedColorTable& table, const Config& config)
    : table_(table), config_(config) {}

Result Pipeline::validate() const {
    Result r = ColorClusterer::validate_threshold(config_.threshold);
    if (r.failure()) return r;

    if (!std::isfinite(config_.name_threshold) || config_.name_threshold < 0.0f) {
        std::ostringstream ss;
        ss << "name threshold must be a finite, non-negative number (got " << config_.name_threshold << ")";
        return Result::fail(ErrorCode::THRESHOLD_OUT_OF_RANGE, ss.str());
    }
    if (!CanonicalNamer::is_valid_prefix(config_.prefix)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "identifier prefix '" + config_.prefix + "' is not a valid custom property name");
    }
    return Result::ok();
}

Result Pipeline::process(const ColorCounts& counts, Output& out) const {
    out = Output{};

    Result valid = validate();
    if (valid.failure()) return valid;

    try {
        ColorClusterer::Config cluster_cfg;
        cluster_cfg.threshold = config_.threshold;
        auto clusters = ColorClusterer(cluster_cfg).cluster(counts);

        // Naming tolerance never exceeds the merge tolerance.
        CanonicalNamer::Config namer_cfg;
        namer_cfg.name_threshold = std::min(config_.name_threshold, config_.threshold);
        namer_cfg.prefix = config_.prefix;
        auto named = CanonicalNamer(table_, namer_cfg).name(clusters);

        Output result;
        result.artifacts = ArtifactBuilder::build(named, counts);
        result.clusters = std::move(named);
        out = std::move(result);
    } catch (const ColorError& e) {
        return Result::fail(e.code(), e.what());
    }
    return Result::ok();
}

Result Pipeline::process(const std::vector<std::pair<std::string, uint64_t>>& literals, Output& out) const {
    out = Output{};

    ColorCounts counts;
    for (const auto& entry : literals) {
        auto hex = HexColor::try_parse(entry.first);
        if (!hex) {
            return Result::fail(ErrorCode::INVALID_COLOR_FORMAT,
                                "invalid hex color literal '" + entry.first + "'");
        }
        counts.add(*hex, entry.second);
    }
    return process(counts, out);
}

}
