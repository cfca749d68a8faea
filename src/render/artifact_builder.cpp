#include "render/artifact_builder.hpp"

namespace hexvar {

const MappingEntry* Artifacts::find(const HexColor& original) const {
    auto it = mapping_index_.find(original);
    return it == mapping_index_.end() ? nullptr : &mapping[it->second];
}

Artifacts ArtifactBuilder::build(const std::vector<NamedCluster>& named, const ColorCounts& counts) {
    Artifacts out;
    out.audit = counts;
    out.declarations.reserve(named.size());

    std::unordered_map<HexColor, const NamedCluster*, HexColorHash> owner;
    for (const auto& nc : named) {
        out.declarations.push_back({nc.identifier, nc.cluster.representative});
        for (const auto& m : nc.cluster.members) {
            owner.emplace(m.hex, &nc);
        }
    }

    out.mapping.reserve(counts.size());
    for (const auto& observed : counts.entries()) {
        auto it = owner.find(observed.hex);
        if (it == owner.end()) {
            throw ColorError(ErrorCode::INVALID_ARGUMENT,
                             "observed color " + observed.hex.str() + " belongs to no cluster");
        }
        out.mapping_index_.emplace(observed.hex, out.mapping.size());
        out.mapping.push_back({observed.hex, it->second->cluster.representative, it->second->identifier});
    }
    return out;
}

}
