#pragma once

#include "core/types.hpp"
#include "render/artifact_builder.hpp"
#include <string>
#include <vector>

namespace hexvar {

class FileRewriter {
public:
    struct Report {
        size_t files_scanned = 0;
        size_t files_changed = 0;
        size_t replacements = 0;
        std::vector<std::string> changed;
        std::vector<std::string> failed;
    };

    explicit FileRewriter(const Artifacts& artifacts) : artifacts_(artifacts) {}

    // Replaces every mapped literal with var(--identifier); unmapped literals stay.
    std::string rewrite_text(const std::string& text, size_t* replacements = nullptr) const;

    // skip: paths never touched (the generated variables file).
    Report rewrite_files(const std::vector<std::string>& files,
                         const std::vector<std::string>& skip,
                         bool dry_run) const;

private:
    const Artifacts& artifacts_;
};

}
