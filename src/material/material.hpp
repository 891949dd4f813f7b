/**
 * @file material.hpp
 * @brief Material class
 */

#ifndef _LUMEN_MATERIAL_MATERIAL_HPP_
#define _LUMEN_MATERIAL_MATERIAL_HPP_

#include "math/color.hpp"
#include "math/tuple.hpp"

namespace lumen {

class Pattern;
class PointLight;

/**
 * Surface properties for the Phong reflection model, plus the coefficients
 * driving recursive reflection and refraction.
 */
class Material
{
public:

    Material();

    // surface color (ignored if pattern is set)
    Color3 color;

    // Phong coefficients
    real_t ambient;
    real_t diffuse;
    real_t specular;
    real_t shininess;

    // 0 is a matte surface, 1 a perfect mirror
    real_t reflective;

    // 0 is opaque
    real_t transparency;

    // only meaningful when transparency is non-zero
    real_t refractive_index;

    // optional pattern replacing color, not owned
    const Pattern* pattern;

    /**
     * Phong lighting of a surface point.
     * @param object_point The point in the object's space, for the pattern.
     * @param world_point The same point in world space.
     * @param eyev Unit vector toward the eye.
     * @param normalv Unit surface normal.
     * @param in_shadow Only the ambient term is kept when true.
     */
    Color3 lighting( const PointLight& light,
                     const Tuple& object_point,
                     const Tuple& world_point,
                     const Tuple& eyev,
                     const Tuple& normalv,
                     bool in_shadow ) const;

    // the surface color at an object-space point
    Color3 color_at( const Tuple& object_point ) const;
};

bool operator==( const Material& lhs, const Material& rhs );

// refractive indices of common substances
static const real_t REFRACTIVE_INDEX_VACUUM = 1.0;
static const real_t REFRACTIVE_INDEX_WATER = 1.333;
static const real_t REFRACTIVE_INDEX_GLASS = 1.5;
static const real_t REFRACTIVE_INDEX_DIAMOND = 2.417;

} /* lumen */

#endif /* _LUMEN_MATERIAL_MATERIAL_HPP_ */
