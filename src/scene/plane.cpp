#include "scene/plane.hpp"

namespace lumen {

Plane::Plane() { }

Plane::~Plane() { }

IntersectionList Plane::local_intersections( const Ray& r ) const
{
    IntersectionList xs;

    // parallel or coplanar rays never hit
    if ( std::fabs( r.d.y ) < EPSILON )
        return xs;

    xs.push_back( Intersection( -r.e.y / r.d.y, this ) );
    return xs;
}

Tuple Plane::local_normal( const Tuple&, const Intersection& ) const
{
    return Tuple::vector( 0, 1, 0 );
}

BoundingBox Plane::local_bounds() const
{
    return BoundingBox( Tuple::point( -INFINITY_REAL, 0, -INFINITY_REAL ),
                        Tuple::point( INFINITY_REAL, 0, INFINITY_REAL ) );
}

} /* lumen */
