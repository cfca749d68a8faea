#include "core/types.hpp"
#include <cctype>

namespace hexvar {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

uint8_t byte_at(const std::string& value, size_t pos) {
    return static_cast<uint8_t>(hex_value(value[pos]) * 16 + hex_value(value[pos + 1]));
}

}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::FILE_NOT_FOUND: return "FileNotFound";
        case ErrorCode::INVALID_COLOR_FORMAT: return "InvalidColorFormat";
        case ErrorCode::THRESHOLD_OUT_OF_RANGE: return "ThresholdOutOfRange";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::IO_ERROR: return "IoError";
    }
    return "Unknown";
}

std::optional<HexColor> HexColor::try_parse(const std::string& text) {
    std::string digits = (!text.empty() && text[0] == '#') ? text.substr(1) : text;

    if (digits.size() != 3 && digits.size() != 6 && digits.size() != 8) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (hex_value(c) < 0) return std::nullopt;
    }

    std::string normalized = "#";
    if (digits.size() == 3) {
        for (char c : digits) {
            normalized += c;
            normalized += c;
        }
    } else {
        normalized += digits;
    }
    for (char& c : normalized) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return HexColor(std::move(normalized));
}

HexColor HexColor::parse(const std::string& text) {
    auto parsed = try_parse(text);
    if (!parsed) {
        throw ColorError(ErrorCode::INVALID_COLOR_FORMAT,
                         "invalid hex color literal '" + text + "'");
    }
    return *parsed;
}

Rgb HexColor::rgb() const {
    if (value_.empty()) return Rgb();
    return Rgb(byte_at(value_, 1), byte_at(value_, 3), byte_at(value_, 5));
}

uint8_t HexColor::alpha() const {
    if (!has_alpha()) return 255;
    return byte_at(value_, 7);
}

void ColorCounts::add(const HexColor& hex, uint64_t n) {
    auto it = index_.find(hex);
    if (it != index_.end()) {
        entries_[it->second].count += n;
        return;
    }
    index_.emplace(hex, entries_.size());
    entries_.push_back({hex, n});
}

uint64_t ColorCounts::count(const HexColor& hex) const {
    auto it = index_.find(hex);
    return it == index_.end() ? 0 : entries_[it->second].count;
}

uint64_t ColorCounts::total() const {
    uint64_t sum = 0;
    for (const auto& e : entries_) sum += e.count;
    return sum;
}

}
