/**
 * @file sphere.cpp
 * @brief Function defnitions for the Sphere class.
 */

#include "scene/sphere.hpp"

namespace lumen {

Sphere::Sphere() { }

Sphere::~Sphere() { }

IntersectionList Sphere::local_intersections( const Ray& r ) const
{
    IntersectionList xs;

    // solve |e + t*d|^2 = 1
    Tuple sphere_to_ray = r.e - Tuple::Origin();
    real_t a = dot( r.d, r.d );
    real_t b = 2 * dot( r.d, sphere_to_ray );
    real_t c = dot( sphere_to_ray, sphere_to_ray ) - 1;

    real_t disc = b * b - 4 * a * c;
    if ( disc < 0 )
        return xs;

    real_t root = std::sqrt( disc );
    xs.push_back( Intersection( ( -b - root ) / ( 2 * a ), this ) );
    xs.push_back( Intersection( ( -b + root ) / ( 2 * a ), this ) );
    return xs;
}

Tuple Sphere::local_normal( const Tuple& point, const Intersection& ) const
{
    return point - Tuple::Origin();
}

BoundingBox Sphere::local_bounds() const
{
    return BoundingBox( Tuple::point( -1, -1, -1 ), Tuple::point( 1, 1, 1 ) );
}

GlassSphere::GlassSphere()
{
    material().transparency = 1.0;
    material().refractive_index = REFRACTIVE_INDEX_GLASS;
}

} /* lumen */
