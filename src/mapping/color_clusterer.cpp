#include "mapping/color_clusterer.hpp"
#include "core/delta_e.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace hexvar {

uint64_t ColorCluster::total_count() const {
    uint64_t sum = 0;
    for (const auto& m : members) sum += m.count;
    return sum;
}

bool ColorCluster::contains(const HexColor& hex) const {
    return std::any_of(members.begin(), members.end(),
                       [&](const ObservedColor& m) { return m.hex == hex; });
}

ColorClusterer::ColorClusterer(const Config& config) : config_(config) {}

Result ColorClusterer::validate_threshold(float threshold) {
    if (!std::isfinite(threshold) || threshold < 0.0f) {
        std::ostringstream ss;
        ss << "cluster threshold must be a finite, non-negative number (got " << threshold << ")";
        return Result::fail(ErrorCode::THRESHOLD_OUT_OF_RANGE, ss.str());
    }
    return Result::ok();
}

std::vector<ObservedColor> ColorClusterer::visit_order(const ColorCounts& counts) {
    std::vector<ObservedColor> order = counts.entries();
    std::stable_sort(order.begin(), order.end(),
                     [](const ObservedColor& a, const ObservedColor& b) {
                         return a.count > b.count;
                     });
    return order;
}

std::vector<ColorCluster> ColorClusterer::cluster(const ColorCounts& counts) const {
    Result valid = validate_threshold(config_.threshold);
    if (valid.failure()) {
        throw ColorError(valid.error, valid.message);
    }

    std::vector<ColorCluster> clusters;
    for (const ObservedColor& color : visit_order(counts)) {
        Lab lab = ColorSpace::to_lab(color.hex);

        ColorCluster* match = nullptr;
        for (auto& c : clusters) {
            if (c.representative.alpha() != color.hex.alpha()) continue;
            if (delta_e(lab, c.lab) < config_.threshold) {
                match = &c;
                break;
            }
        }

        if (match) {
            match->members.push_back(color);
            continue;
        }

        ColorCluster created;
        created.representative = color.hex;
        created.lab = lab;
        created.members.push_back(color);
        clusters.push_back(std::move(created));
    }
    return clusters;
}

}
