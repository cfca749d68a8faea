#pragma once

#include "core/types.hpp"
#include "core/color_space.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hexvar {

// Read-only lookup of reference colors by perceptual proximity.
class NamedColorTable {
public:
    struct Entry {
        std::string name;
        HexColor hex;
        Lab lab;
    };

    struct Match {
        const Entry* entry = nullptr;
        float distance = 0.0f;
    };

    NamedColorTable() = default;
    // Throws ColorError if any hex value is malformed.
    explicit NamedColorTable(const std::vector<std::pair<std::string, std::string>>& rows);

    // Nearest entry strictly closer than max_distance; ties keep table order.
    std::optional<Match> nearest(const Lab& lab, float max_distance) const;

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // The CSS Color Module Level 4 named colors.
    static const NamedColorTable& css();

private:
    std::vector<Entry> entries_;
};

}
