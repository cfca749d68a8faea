#include "core/delta_e.hpp"
#include <cmath>

namespace hexvar {

float delta_e(const Lab& c1, const Lab& c2) {
    float dL = c1.L - c2.L;
    float da = c1.a - c2.a;
    float db = c1.b - c2.b;
    return std::sqrt(dL * dL + da * da + db * db);
}

float delta_e(const HexColor& c1, const HexColor& c2) {
    return delta_e(ColorSpace::to_lab(c1), ColorSpace::to_lab(c2));
}

}
