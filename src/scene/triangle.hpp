/**
 * @file triangle.hpp
 * @brief Class definitions for Triangle and SmoothTriangle.
 */

#ifndef _LUMEN_SCENE_TRIANGLE_HPP_
#define _LUMEN_SCENE_TRIANGLE_HPP_

#include "scene/shape.hpp"

namespace lumen {

/**
 * A flat triangle given by three object-space points. The edges and the
 * face normal are computed once at construction.
 */
class Triangle : public Shape
{
public:

    Tuple p1, p2, p3;
    // p2 - p1 and p3 - p1
    Tuple e1, e2;
    Tuple face_normal;

    Triangle( const Tuple& p1, const Tuple& p2, const Tuple& p3 );
    virtual ~Triangle();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
    virtual BoundingBox local_bounds() const;

    /**
     * Moller-Trumbore ray/triangle test. On a hit, stores the ray parameter
     * and the barycentric coordinates of the hit point and returns true.
     * Rays parallel to the plane of the triangle never hit.
     */
    bool hit( const Ray& r, real_t* t, real_t* u, real_t* v ) const;
};

/**
 * A triangle whose normal is interpolated from per-vertex normals using the
 * barycentric coordinates of the hit.
 */
class SmoothTriangle : public Triangle
{
public:

    Tuple n1, n2, n3;

    SmoothTriangle( const Tuple& p1, const Tuple& p2, const Tuple& p3,
                    const Tuple& n1, const Tuple& n2, const Tuple& n3 );
    virtual ~SmoothTriangle();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
};

} /* lumen */

#endif /* _LUMEN_SCENE_TRIANGLE_HPP_ */
