#include "scan/file_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace hexvar {

namespace fs = std::filesystem;

namespace {

bool has_wildcard(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Attribute whose value is a URL, e.g. href="#top", :href='#top', xlink:href=#top.
bool in_url_attribute(const std::string& text, size_t pos) {
    size_t i = pos;
    if (i > 0 && (text[i - 1] == '"' || text[i - 1] == '\'')) --i;
    while (i > 0 && is_blank(text[i - 1])) --i;
    if (i == 0 || text[i - 1] != '=') return false;
    --i;
    while (i > 0 && is_blank(text[i - 1])) --i;

    size_t end = i;
    while (i > 0 && (is_ident_char(text[i - 1]) || text[i - 1] == ':')) --i;
    std::string name = to_lower_copy(text.substr(i, end - i));
    size_t colon = name.rfind(':');
    if (colon != std::string::npos) name = name.substr(colon + 1);
    return name == "href" || name == "src" || name == "action";
}

bool is_color_literal(const std::string& text, size_t pos, size_t len) {
    if (pos > 0) {
        char before = text[pos - 1];
        if (before == '&' || is_ident_char(before)) return false;
    }
    size_t next = pos + len;
    if (next < text.size() && is_ident_char(text[next])) return false;
    while (next < text.size() && is_blank(text[next])) ++next;
    if (next < text.size() && text[next] == '{') return false;
    return !in_url_attribute(text, pos);
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

}

const std::regex& hex_literal_regex() {
    static const std::regex re("#(?:[0-9a-fA-F]{8}|[0-9a-fA-F]{6}|[0-9a-fA-F]{3})(?![0-9a-fA-F])");
    return re;
}

std::vector<LiteralMatch> find_hex_literals(const std::string& text) {
    std::vector<LiteralMatch> found;
    const std::regex& re = hex_literal_regex();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        size_t pos = static_cast<size_t>(it->position());
        size_t len = static_cast<size_t>(it->length());
        if (is_color_literal(text, pos, len)) {
            found.push_back({pos, len});
        }
    }
    return found;
}

std::string glob_to_regex(const std::string& pattern) {
    std::string regex = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        switch (c) {
            case '*':
                if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                    ++i;
                    if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
                        ++i;
                        regex += "(?:.*/)?";
                    } else {
                        regex += ".*";
                    }
                } else {
                    regex += "[^/]*";
                }
                break;
            case '?': regex += "[^/]"; break;
            case '.': regex += "\\."; break;
            case '\\': regex += "\\\\"; break;
            case '+': case '^': case '$': case '(': case ')':
            case '[': case ']': case '{': case '}': case '|':
                regex += '\\';
                regex += c;
                break;
            default:
                regex += c;
                break;
        }
    }
    regex += "$";
    return regex;
}

FileScanner::FileScanner(const Config& config) : config_(config) {}

bool FileScanner::is_excluded(const std::string& path) const {
    for (const auto& ig : config_.ignore) {
        if (!ig.empty() && path.find(ig) != std::string::npos) return true;
    }
    for (const auto& part : fs::path(path)) {
        std::string s = part.string();
        if (std::find(config_.exclude_dirs.begin(), config_.exclude_dirs.end(), s) != config_.exclude_dirs.end()) {
            return true;
        }
    }
    return false;
}

bool FileScanner::has_allowed_extension(const std::string& path) const {
    std::string ext = fs::path(path).extension().string();
    if (ext.size() < 2) return false;
    ext = to_lower_copy(ext.substr(1));
    for (const auto& allowed : config_.extensions) {
        if (to_lower_copy(allowed) == ext) return true;
    }
    return false;
}

void FileScanner::expand_pattern(const std::string& pattern, std::vector<std::string>& out) const {
    std::string generic = fs::path(pattern).generic_string();
    std::vector<std::string> matches;
    std::error_code ec;

    if (!has_wildcard(generic)) {
        fs::path p(generic);
        if (fs::is_regular_file(p, ec)) {
            out.push_back(p.generic_string());
            return;
        }
        if (!fs::is_directory(p, ec)) return;
        generic = (p / "**" / "*").generic_string();
    }

    // Split into the literal directory prefix and the wildcard remainder.
    size_t wild = generic.find_first_of("*?[");
    size_t slash = generic.rfind('/', wild);
    fs::path base = ".";
    std::string rest = generic;
    if (slash != std::string::npos) {
        base = slash == 0 ? fs::path("/") : fs::path(generic.substr(0, slash));
        rest = generic.substr(slash + 1);
    }

    if (!fs::is_directory(base, ec)) return;

    std::regex matcher(glob_to_regex(rest));
    bool recursive = rest.find('/') != std::string::npos || rest.find("**") != std::string::npos;
    bool dot_base = slash == std::string::npos;

    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) return;
        std::string rel = entry.path().lexically_relative(base).generic_string();
        if (!std::regex_match(rel, matcher)) return;
        std::string shown = dot_base ? rel : entry.path().generic_string();
        if (is_excluded(shown) || !has_allowed_extension(shown)) return;
        matches.push_back(shown);
    };

    if (recursive) {
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec)) {
                std::string name = it->path().filename().string();
                if (std::find(config_.exclude_dirs.begin(), config_.exclude_dirs.end(), name) != config_.exclude_dirs.end()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            consider(*it);
        }
    } else {
        for (const auto& entry : fs::directory_iterator(base, fs::directory_options::skip_permission_denied, ec)) {
            consider(entry);
        }
    }

    std::sort(matches.begin(), matches.end());
    out.insert(out.end(), matches.begin(), matches.end());
}

std::vector<std::string> FileScanner::discover() const {
    std::vector<std::string> all;
    for (const auto& pattern : config_.patterns) {
        expand_pattern(pattern, all);
    }

    // "src/a.css" and "./src/a.css" are the same file; the first spelling wins.
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (auto& path : all) {
        std::string key = fs::path(path).lexically_normal().generic_string();
        if (seen.insert(key).second) unique.push_back(std::move(path));
    }
    return unique;
}

std::vector<HexColor> FileScanner::extract(const std::string& text) {
    std::vector<HexColor> found;
    for (const auto& m : find_hex_literals(text)) {
        found.push_back(HexColor::parse(text.substr(m.position, m.length)));
    }
    return found;
}

FileScanner::ScanResult FileScanner::scan() const {
    return scan_files(discover());
}

FileScanner::ScanResult FileScanner::scan_files(const std::vector<std::string>& files) const {
    struct FileHits {
        bool readable = false;
        std::vector<std::string> literals;
    };

    std::vector<FileHits> hits(files.size());
    const long n = static_cast<long>(files.size());
    size_t done = 0;

#ifdef HAS_OPENMP
    #pragma omp parallel for schedule(dynamic) if(config_.parallel)
#endif
    for (long i = 0; i < n; ++i) {
        std::string content;
        if (read_file(files[i], content)) {
            hits[i].readable = true;
            for (const auto& m : find_hex_literals(content)) {
                hits[i].literals.push_back(content.substr(m.position, m.length));
            }
        }

        if (config_.progress) {
#ifdef HAS_OPENMP
            #pragma omp critical(hexvar_scan_progress)
#endif
            {
                ++done;
                *config_.progress << "\rScanning files: " << done << "/" << n << std::flush;
            }
        }
    }
    if (config_.progress && n > 0) {
        *config_.progress << "\r" << std::string(40, ' ') << "\r" << std::flush;
    }

    // Merge in file order so first-seen order is reproducible.
    ScanResult result;
    result.files = files;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (!hits[i].readable) {
            result.unreadable.push_back(files[i]);
            continue;
        }
        for (const auto& literal : hits[i].literals) {
            result.counts.add(HexColor::parse(literal));
        }
    }
    return result;
}

}
