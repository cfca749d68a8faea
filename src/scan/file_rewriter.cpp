#include "scan/file_rewriter.hpp"
#include "scan/file_scanner.hpp"
#include "render/artifact_writer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace hexvar {

namespace fs = std::filesystem;

namespace {

bool same_file(const std::string& a, const std::string& b) {
    std::error_code ec;
    if (fs::exists(a, ec) && fs::exists(b, ec)) {
        bool eq = fs::equivalent(a, b, ec);
        if (!ec) return eq;
    }
    return fs::path(a).lexically_normal() == fs::path(b).lexically_normal();
}

}

std::string FileRewriter::rewrite_text(const std::string& text, size_t* replacements) const {
    std::string out;
    out.reserve(text.size());
    size_t count = 0;
    size_t last = 0;

    // Same literal boundaries as the scan, so only counted literals are touched.
    for (const auto& m : find_hex_literals(text)) {
        out.append(text, last, m.position - last);
        last = m.position + m.length;

        std::string literal = text.substr(m.position, m.length);
        const MappingEntry* entry = artifacts_.find(HexColor::parse(literal));
        if (entry) {
            out += "var(--" + entry->identifier + ")";
            ++count;
        } else {
            out += literal;
        }
    }
    out.append(text, last, std::string::npos);

    if (replacements) *replacements = count;
    return out;
}

FileRewriter::Report FileRewriter::rewrite_files(const std::vector<std::string>& files,
                                                 const std::vector<std::string>& skip,
                                                 bool dry_run) const {
    Report report;
    for (const auto& path : files) {
        bool skipped = std::any_of(skip.begin(), skip.end(),
                                   [&](const std::string& s) { return !s.empty() && same_file(path, s); });
        if (skipped) continue;
        ++report.files_scanned;

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            report.failed.push_back(path);
            continue;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        in.close();

        size_t n = 0;
        std::string rewritten = rewrite_text(ss.str(), &n);
        if (n == 0) continue;

        if (!dry_run) {
            Result written = write_text_file(path, rewritten);
            if (written.failure()) {
                report.failed.push_back(path);
                continue;
            }
        }
        ++report.files_changed;
        report.replacements += n;
        report.changed.push_back(path);
    }
    return report;
}

}
