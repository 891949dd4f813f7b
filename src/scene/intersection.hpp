/**
 * @file intersection.hpp
 * @brief Hit records and the shading state derived from the nearest hit.
 */

#ifndef _LUMEN_SCENE_INTERSECTION_HPP_
#define _LUMEN_SCENE_INTERSECTION_HPP_

#include "math/tuple.hpp"
#include "scene/ray.hpp"
#include <vector>

namespace lumen {

class Shape;

/**
 * A single ray/shape intersection. Negative t values are valid (the
 * refraction bookkeeping needs them) but never visible. (u, v) are the
 * barycentric coordinates of a triangle hit; smooth triangles use them to
 * interpolate their vertex normals.
 */
struct Intersection
{
    real_t t;
    const Shape* object;
    bool has_uv;
    real_t u, v;

    Intersection() : t( 0 ), object( 0 ), has_uv( false ), u( 0 ), v( 0 ) { }
    Intersection( real_t t, const Shape* object )
        : t( t ), object( object ), has_uv( false ), u( 0 ), v( 0 ) { }
    Intersection( real_t t, const Shape* object, real_t u, real_t v )
        : t( t ), object( object ), has_uv( true ), u( u ), v( v ) { }
};

// orders by t
bool operator<( const Intersection& lhs, const Intersection& rhs );
// same object, t within EPSILON
bool operator==( const Intersection& lhs, const Intersection& rhs );

// producers append in any order, consumers sort
typedef std::vector<Intersection> IntersectionList;

void sort_intersections( IntersectionList& xs );

/**
 * Returns the intersection with the smallest strictly positive t, or null if
 * there is none. Works on sorted and unsorted lists alike.
 */
const Intersection* find_hit( const IntersectionList& xs );

/**
 * Everything the shading stage needs to know about a hit.
 */
struct IntersectionState
{
    real_t t;
    const Shape* object;
    // the world-space hit point
    Tuple point;
    // point nudged along the normal, origin of shadow and reflection rays
    Tuple over_point;
    // point nudged against the normal, origin of refraction rays
    Tuple under_point;
    Tuple eyev;
    // always facing the eye
    Tuple normalv;
    Tuple reflectv;
    // the ray started inside the object
    bool inside;
    // refractive indices on the incoming and outgoing side of the surface
    real_t n1, n2;
};

/**
 * Computes the shading state of hit, which must be one of the entries of xs.
 * xs must be sorted; it is walked to find the refractive indices on both
 * sides of the hit surface.
 */
IntersectionState prepare_computations( const Intersection& hit, const Ray& r,
                                        const IntersectionList& xs );

// same, with the hit as the only known intersection
IntersectionState prepare_computations( const Intersection& hit, const Ray& r );

/**
 * Schlick's approximation of the Fresnel reflectance at the hit: the fraction
 * of light reflected rather than refracted. 1 under total internal reflection.
 */
real_t schlick( const IntersectionState& comps );

} /* lumen */

#endif /* _LUMEN_SCENE_INTERSECTION_HPP_ */
