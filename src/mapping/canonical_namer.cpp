#include "mapping/canonical_namer.hpp"
#include <cctype>

namespace hexvar {

CanonicalNamer::CanonicalNamer(const NamedColorTable& table, const Config& config)
    : table_(table), config_(config) {}

std::string CanonicalNamer::slugify(const std::string& text) {
    std::string slug;
    bool pending_sep = false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_sep && !slug.empty()) slug += '-';
            pending_sep = false;
            slug += static_cast<char>(std::tolower(uc));
        } else {
            pending_sep = true;
        }
    }
    return slug;
}

bool CanonicalNamer::is_valid_prefix(const std::string& prefix) {
    if (prefix.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(prefix[0]))) return false;
    return slugify(prefix) == prefix;
}

std::string CanonicalNamer::base_identifier(const ColorCluster& cluster, std::string* color_name) const {
    if (color_name) color_name->clear();

    if (!cluster.representative.has_alpha() || cluster.representative.alpha() == 255) {
        auto match = table_.nearest(cluster.lab, config_.name_threshold);
        if (match) {
            std::string slug = slugify(match->entry->name);
            if (!slug.empty()) {
                if (color_name) *color_name = match->entry->name;
                return config_.prefix + "-" + slug;
            }
        }
    }
    return config_.prefix + "-" + cluster.representative.digits();
}

std::string CanonicalNamer::make_unique(const std::string& base, std::unordered_set<std::string>& taken) {
    if (taken.insert(base).second) return base;
    for (int n = 1;; ++n) {
        std::string candidate = base + "-" + std::to_string(n);
        if (taken.insert(candidate).second) return candidate;
    }
}

std::vector<NamedCluster> CanonicalNamer::name(const std::vector<ColorCluster>& clusters) const {
    if (!is_valid_prefix(config_.prefix)) {
        throw ColorError(ErrorCode::INVALID_ARGUMENT,
                         "identifier prefix '" + config_.prefix +
                         "' must start with a letter and contain only lowercase letters, digits and single hyphens");
    }

    std::unordered_set<std::string> taken;
    std::vector<NamedCluster> named;
    named.reserve(clusters.size());

    for (const auto& cluster : clusters) {
        NamedCluster nc;
        nc.cluster = cluster;
        nc.identifier = make_unique(base_identifier(cluster, &nc.color_name), taken);
        named.push_back(std::move(nc));
    }
    return named;
}

}
