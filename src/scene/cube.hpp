/**
 * @file cube.hpp
 * @brief Class definition for Cube.
 */

#ifndef _LUMEN_SCENE_CUBE_HPP_
#define _LUMEN_SCENE_CUBE_HPP_

#include "scene/shape.hpp"

namespace lumen {

/**
 * The axis-aligned cube spanning -1..1 on every axis in object space.
 */
class Cube : public Shape
{
public:

    Cube();
    virtual ~Cube();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
    virtual BoundingBox local_bounds() const;
};

} /* lumen */

#endif /* _LUMEN_SCENE_CUBE_HPP_ */
