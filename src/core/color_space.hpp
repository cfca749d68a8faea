#pragma once

#include "core/types.hpp"
#include <array>
#include <cstdint>
#include <cmath>
#include <string>

namespace hexvar {

struct LinearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    LinearColor() = default;
    LinearColor(float r, float g, float b) : r(r), g(g), b(b) {}
};

struct Xyz {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

// CIELAB, D65 white point.
struct Lab {
    float L = 0.0f;
    float a = 0.0f;
    float b = 0.0f;

    Lab() = default;
    Lab(float L, float a, float b) : L(L), a(a), b(b) {}

    bool operator==(const Lab& o) const { return L == o.L && a == o.a && b == o.b; }
};

class ColorSpace {
public:
    static float srgb_to_linear(uint8_t srgb);
    static uint8_t linear_to_srgb(float linear);

    static LinearColor srgb_to_linear(const Rgb& rgb);
    static Rgb linear_to_srgb(const LinearColor& linear);

    static Xyz linear_to_xyz(const LinearColor& linear);
    static LinearColor xyz_to_linear(const Xyz& xyz);

    static Lab xyz_to_lab(const Xyz& xyz);
    static Xyz lab_to_xyz(const Lab& lab);

    static Lab rgb_to_lab(const Rgb& rgb);
    static Rgb lab_to_rgb(const Lab& lab);

    static Lab to_lab(const HexColor& hex);
    // Throws ColorError(INVALID_COLOR_FORMAT) on a malformed literal.
    static Lab to_lab(const std::string& hex);

    static HexColor to_hex(const Rgb& rgb);
    static HexColor to_hex(const Rgb& rgb, uint8_t alpha);

    static constexpr float WHITE_X = 0.95047f;
    static constexpr float WHITE_Y = 1.00000f;
    static constexpr float WHITE_Z = 1.08883f;

private:
    static const std::array<float, 256>& decode_lut();
    static float srgb_decode(uint8_t c);
    static uint8_t srgb_encode(float c);

    static float lab_f(float t);
    static float lab_f_inv(float t);
};

}
