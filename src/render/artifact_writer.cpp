#include "render/artifact_writer.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace hexvar {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string render_css_vars(const Artifacts& artifacts) {
    std::ostringstream ss;
    ss << ":root {\n";
    for (const auto& d : artifacts.declarations) {
        ss << "    --" << d.identifier << ": " << d.hex.str() << ";\n";
    }
    ss << "}\n";
    return ss.str();
}

std::string render_mapping_json(const Artifacts& artifacts) {
    if (artifacts.mapping.empty()) return "{}";

    std::ostringstream ss;
    ss << "{\n";
    for (size_t i = 0; i < artifacts.mapping.size(); ++i) {
        const auto& m = artifacts.mapping[i];
        ss << "  \"" << json_escape(m.original.str()) << "\": {\n"
           << "    \"identifier\": \"" << json_escape(m.identifier) << "\",\n"
           << "    \"representative\": \"" << json_escape(m.representative.str()) << "\",\n"
           << "    \"replacement\": \"var(--" << json_escape(m.identifier) << ")\"\n"
           << "  }" << (i + 1 < artifacts.mapping.size() ? "," : "") << "\n";
    }
    ss << "}";
    return ss.str();
}

std::string render_audit_json(const ColorCounts& counts) {
    if (counts.empty()) return "{}";

    std::ostringstream ss;
    ss << "{\n";
    const auto& entries = counts.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        ss << "  \"" << json_escape(entries[i].hex.str()) << "\": " << entries[i].count
           << (i + 1 < entries.size() ? "," : "") << "\n";
    }
    ss << "}";
    return ss.str();
}

Result write_text_file(const std::string& path, const std::string& content) {
    namespace fs = std::filesystem;

    // Write beside the target and rename over it, so a failed write never
    // leaves the target half written.
    const fs::path target(path);
    fs::path tmp = target;
    tmp += ".hexvar-tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result::fail(ErrorCode::IO_ERROR, "cannot open " + tmp.string() + " for writing");
        }
        out << content;
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return Result::fail(ErrorCode::IO_ERROR, "failed writing " + tmp.string());
        }
    }

    std::error_code ec;
    // Keep the mode of a file being replaced.
    if (fs::is_regular_file(target, ec)) {
        fs::permissions(tmp, fs::status(target, ec).permissions(), ec);
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result::fail(ErrorCode::IO_ERROR, "cannot replace " + path + ": " + ec.message());
    }
    return Result::ok();
}

}
