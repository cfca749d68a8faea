#include "core/color_space.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

namespace hexvar {

float ColorSpace::srgb_decode(uint8_t c) {
    float cv = c / 255.0f;
    if (cv <= 0.04045f) {
        return cv / 12.92f;
    }
    return std::pow((cv + 0.055f) / 1.055f, 2.4f);
}

uint8_t ColorSpace::srgb_encode(float c) {
    c = std::clamp(c, 0.0f, 1.0f);
    float result;
    if (c <= 0.0031308f) {
        result = 12.92f * c;
    } else {
        result = 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
    }
    return static_cast<uint8_t>(std::clamp(std::round(result * 255.0f), 0.0f, 255.0f));
}

const std::array<float, 256>& ColorSpace::decode_lut() {
    static const std::array<float, 256> lut = [] {
        std::array<float, 256> table{};
        for (int i = 0; i < 256; ++i) {
            table[i] = srgb_decode(static_cast<uint8_t>(i));
        }
        return table;
    }();
    return lut;
}

float ColorSpace::srgb_to_linear(uint8_t srgb) {
    return decode_lut()[srgb];
}

uint8_t ColorSpace::linear_to_srgb(float linear) {
    return srgb_encode(linear);
}

LinearColor ColorSpace::srgb_to_linear(const Rgb& rgb) {
    return {srgb_to_linear(rgb.r), srgb_to_linear(rgb.g), srgb_to_linear(rgb.b)};
}

Rgb ColorSpace::linear_to_srgb(const LinearColor& linear) {
    return {linear_to_srgb(linear.r), linear_to_srgb(linear.g), linear_to_srgb(linear.b)};
}

Xyz ColorSpace::linear_to_xyz(const LinearColor& linear) {
    float r = linear.r;
    float g = linear.g;
    float b = linear.b;

    Xyz xyz;
    xyz.x = 0.4124564f * r + 0.3575761f * g + 0.1804375f * b;
    xyz.y = 0.2126729f * r + 0.7151522f * g + 0.0721750f * b;
    xyz.z = 0.0193339f * r + 0.1191920f * g + 0.9503041f * b;
    return xyz;
}

LinearColor ColorSpace::xyz_to_linear(const Xyz& xyz) {
    float r =  3.2404542f * xyz.x - 1.5371385f * xyz.y - 0.4985314f * xyz.z;
    float g = -0.9692660f * xyz.x + 1.8760108f * xyz.y + 0.0415560f * xyz.z;
    float b =  0.0556434f * xyz.x - 0.2040259f * xyz.y + 1.0572252f * xyz.z;

    return {std::clamp(r, 0.0f, 1.0f),
            std::clamp(g, 0.0f, 1.0f),
            std::clamp(b, 0.0f, 1.0f)};
}

float ColorSpace::lab_f(float t) {
    constexpr float delta = 6.0f / 29.0f;
    if (t > delta * delta * delta) {
        return std::cbrt(t);
    }
    return t / (3.0f * delta * delta) + 4.0f / 29.0f;
}

float ColorSpace::lab_f_inv(float t) {
    constexpr float delta = 6.0f / 29.0f;
    if (t > delta) {
        return t * t * t;
    }
    return 3.0f * delta * delta * (t - 4.0f / 29.0f);
}

Lab ColorSpace::xyz_to_lab(const Xyz& xyz) {
    float fx = lab_f(xyz.x / WHITE_X);
    float fy = lab_f(xyz.y / WHITE_Y);
    float fz = lab_f(xyz.z / WHITE_Z);

    return {116.0f * fy - 16.0f,
            500.0f * (fx - fy),
            200.0f * (fy - fz)};
}

Xyz ColorSpace::lab_to_xyz(const Lab& lab) {
    float fy = (lab.L + 16.0f) / 116.0f;
    float fx = fy + lab.a / 500.0f;
    float fz = fy - lab.b / 200.0f;

    Xyz xyz;
    xyz.x = WHITE_X * lab_f_inv(fx);
    xyz.y = WHITE_Y * lab_f_inv(fy);
    xyz.z = WHITE_Z * lab_f_inv(fz);
    return xyz;
}

Lab ColorSpace::rgb_to_lab(const Rgb& rgb) {
    return xyz_to_lab(linear_to_xyz(srgb_to_linear(rgb)));
}

Rgb ColorSpace::lab_to_rgb(const Lab& lab) {
    return linear_to_srgb(xyz_to_linear(lab_to_xyz(lab)));
}

Lab ColorSpace::to_lab(const HexColor& hex) {
    if (hex.empty()) {
        throw ColorError(ErrorCode::INVALID_COLOR_FORMAT, "empty hex color");
    }
    return rgb_to_lab(hex.rgb());
}

Lab ColorSpace::to_lab(const std::string& hex) {
    return to_lab(HexColor::parse(hex));
}

HexColor ColorSpace::to_hex(const Rgb& rgb) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", rgb.r, rgb.g, rgb.b);
    return HexColor::parse(buf);
}

HexColor ColorSpace::to_hex(const Rgb& rgb, uint8_t alpha) {
    if (alpha == 255) return to_hex(rgb);
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", rgb.r, rgb.g, rgb.b, alpha);
    return HexColor::parse(buf);
}

}
