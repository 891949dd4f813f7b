/**
 * @file cylinder.hpp
 * @brief Class definition for Cylinder.
 */

#ifndef _LUMEN_SCENE_CYLINDER_HPP_
#define _LUMEN_SCENE_CYLINDER_HPP_

#include "scene/shape.hpp"

namespace lumen {

/**
 * A cylinder of radius 1 around the object-space y axis, truncated to
 * minimum < y < maximum (exclusive). Infinite by default. A closed cylinder
 * also has caps at both ends.
 */
class Cylinder : public Shape
{
public:

    real_t minimum;
    real_t maximum;
    bool closed;

    Cylinder();
    Cylinder( real_t minimum, real_t maximum, bool closed );
    virtual ~Cylinder();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
    virtual BoundingBox local_bounds() const;

private:

    void intersect_caps( const Ray& r, IntersectionList& xs ) const;
};

} /* lumen */

#endif /* _LUMEN_SCENE_CYLINDER_HPP_ */
