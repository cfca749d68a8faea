#pragma once

#include "core/types.hpp"
#include "mapping/canonical_namer.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace hexvar {

struct Declaration {
    std::string identifier;
    HexColor hex;
};

struct MappingEntry {
    HexColor original;
    HexColor representative;
    std::string identifier;
};

struct Artifacts {
    std::vector<Declaration> declarations;   // cluster order
    std::vector<MappingEntry> mapping;       // input order, one per observed literal
    ColorCounts audit;

    const MappingEntry* find(const HexColor& original) const;

private:
    friend class ArtifactBuilder;
    std::unordered_map<HexColor, size_t, HexColorHash> mapping_index_;
};

class ArtifactBuilder {
public:
    static Artifacts build(const std::vector<NamedCluster>& named, const ColorCounts& counts);
};

}
