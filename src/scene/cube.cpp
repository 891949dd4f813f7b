#include "scene/cube.hpp"

namespace lumen {

Cube::Cube() { }

Cube::~Cube() { }

IntersectionList Cube::local_intersections( const Ray& r ) const
{
    IntersectionList xs;
    real_t tmin = -INFINITY_REAL;
    real_t tmax = INFINITY_REAL;

    for ( size_t i = 0; i < 3; i++ ) {
        real_t axis_min, axis_max;
        BoundingBox::check_axis( r.e[i], r.d[i], -1, 1, &axis_min, &axis_max );
        tmin = std::max( tmin, axis_min );
        tmax = std::min( tmax, axis_max );
    }

    if ( tmin > tmax )
        return xs;

    xs.push_back( Intersection( tmin, this ) );
    xs.push_back( Intersection( tmax, this ) );
    return xs;
}

Tuple Cube::local_normal( const Tuple& point, const Intersection& ) const
{
    real_t ax = std::fabs( point.x );
    real_t ay = std::fabs( point.y );
    real_t az = std::fabs( point.z );
    real_t maxc = std::max( ax, std::max( ay, az ) );

    if ( maxc == ax )
        return Tuple::vector( point.x, 0, 0 );
    if ( maxc == ay )
        return Tuple::vector( 0, point.y, 0 );
    return Tuple::vector( 0, 0, point.z );
}

BoundingBox Cube::local_bounds() const
{
    return BoundingBox( Tuple::point( -1, -1, -1 ), Tuple::point( 1, 1, 1 ) );
}

} /* lumen */
