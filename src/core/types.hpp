#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace hexvar {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_COLOR_FORMAT,
    THRESHOLD_OUT_OF_RANGE,
    INVALID_ARGUMENT,
    IO_ERROR
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

// Thrown by value-returning core operations; the pipeline turns it into a Result.
class ColorError : public std::runtime_error {
public:
    ColorError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;

    Rgb() = default;
    Rgb(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

class HexColor {
public:
    HexColor() = default;

    // Accepts "#rrggbb", "#rrggbbaa" and "#rgb" in any case, '#' optional.
    static HexColor parse(const std::string& text);
    static std::optional<HexColor> try_parse(const std::string& text);

    const std::string& str() const { return value_; }
    std::string digits() const { return value_.empty() ? value_ : value_.substr(1); }
    bool empty() const { return value_.empty(); }
    bool has_alpha() const { return value_.size() == 9; }

    Rgb rgb() const;
    uint8_t alpha() const;

    bool operator==(const HexColor& o) const { return value_ == o.value_; }
    bool operator!=(const HexColor& o) const { return value_ != o.value_; }
    bool operator<(const HexColor& o) const { return value_ < o.value_; }

private:
    explicit HexColor(std::string normalized) : value_(std::move(normalized)) {}

    std::string value_;
};

struct HexColorHash {
    size_t operator()(const HexColor& c) const { return std::hash<std::string>()(c.str()); }
};

struct ObservedColor {
    HexColor hex;
    uint64_t count = 0;
};

// HexColor -> occurrence count, iterated in first-insertion order.
class ColorCounts {
public:
    void add(const HexColor& hex, uint64_t n = 1);

    uint64_t count(const HexColor& hex) const;
    bool contains(const HexColor& hex) const { return index_.count(hex) != 0; }

    const std::vector<ObservedColor>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    uint64_t total() const;

private:
    std::vector<ObservedColor> entries_;
    std::unordered_map<HexColor, size_t, HexColorHash> index_;
};

}
