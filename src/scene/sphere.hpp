/**
 * @file sphere.hpp
 * @brief Class defnition for Sphere.
 */

#ifndef _LUMEN_SCENE_SPHERE_HPP_
#define _LUMEN_SCENE_SPHERE_HPP_

#include "scene/shape.hpp"

namespace lumen {

/**
 * The unit sphere centered on the object-space origin. Position and radius
 * come from the transform.
 */
class Sphere : public Shape
{
public:

    Sphere();
    virtual ~Sphere();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
    virtual BoundingBox local_bounds() const;
};

/**
 * A sphere of transparent glass: transparency 1, refractive index 1.5.
 * Handy for testing refraction.
 */
class GlassSphere : public Sphere
{
public:

    GlassSphere();
};

} /* lumen */

#endif /* _LUMEN_SCENE_SPHERE_HPP_ */
