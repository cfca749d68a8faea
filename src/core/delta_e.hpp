#pragma once

#include "core/color_space.hpp"

namespace hexvar {

// CIE76: Euclidean distance in CIELAB. Symmetric, zero iff the coordinates match.
float delta_e(const Lab& c1, const Lab& c2);

float delta_e(const HexColor& c1, const HexColor& c2);

}
