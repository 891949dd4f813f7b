
#ifndef _LUMEN_LIGHT_POINT_HPP_
#define _LUMEN_LIGHT_POINT_HPP_

#include "math/tuple.hpp"
#include "math/color.hpp"

namespace lumen {

/**
 * A light source with no size, radiating from a single point.
 */
class PointLight {
public:
    PointLight();
    PointLight(const Tuple &posi, const Color3 &intensityi)
        : position(posi), intensity(intensityi) { }

    // The position of the light, relative to world origin.
    Tuple position;
    // The color and brightness of the light.
    Color3 intensity;
};

bool operator==(const PointLight &lhs, const PointLight &rhs);

} /* lumen */

#endif /* _LUMEN_LIGHT_POINT_HPP_ */
