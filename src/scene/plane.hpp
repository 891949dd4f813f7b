/**
 * @file plane.hpp
 * @brief Class definition for Plane.
 */

#ifndef _LUMEN_SCENE_PLANE_HPP_
#define _LUMEN_SCENE_PLANE_HPP_

#include "scene/shape.hpp"

namespace lumen {

/**
 * The infinite xz plane through the object-space origin.
 */
class Plane : public Shape
{
public:

    Plane();
    virtual ~Plane();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
    virtual BoundingBox local_bounds() const;
};

} /* lumen */

#endif /* _LUMEN_SCENE_PLANE_HPP_ */
