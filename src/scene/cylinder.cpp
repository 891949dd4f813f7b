/**
 * @file cylinder.cpp
 * @brief Side and cap intersection of the y-axis cylinder.
 */

#include "scene/cylinder.hpp"

namespace lumen {

// true if the point at t lies within the unit radius of a cap plane
static bool check_cap( const Ray& r, real_t t )
{
    real_t x = r.e.x + t * r.d.x;
    real_t z = r.e.z + t * r.d.z;
    return x * x + z * z <= 1;
}

Cylinder::Cylinder()
    : minimum( -INFINITY_REAL ), maximum( INFINITY_REAL ), closed( false ) { }

Cylinder::Cylinder( real_t minimum, real_t maximum, bool closed )
    : minimum( minimum ), maximum( maximum ), closed( closed ) { }

Cylinder::~Cylinder() { }

IntersectionList Cylinder::local_intersections( const Ray& r ) const
{
    IntersectionList xs;
    real_t a = r.d.x * r.d.x + r.d.z * r.d.z;

    // parallel to the axis: only the caps can be hit
    if ( std::fabs( a ) >= EPSILON ) {
        real_t b = 2 * r.e.x * r.d.x + 2 * r.e.z * r.d.z;
        real_t c = r.e.x * r.e.x + r.e.z * r.e.z - 1;
        real_t disc = b * b - 4 * a * c;

        if ( disc < 0 )
            return xs;

        real_t root = std::sqrt( disc );
        real_t t0 = ( -b - root ) / ( 2 * a );
        real_t t1 = ( -b + root ) / ( 2 * a );
        if ( t0 > t1 )
            std::swap( t0, t1 );

        real_t y0 = r.e.y + t0 * r.d.y;
        if ( minimum < y0 && y0 < maximum )
            xs.push_back( Intersection( t0, this ) );

        real_t y1 = r.e.y + t1 * r.d.y;
        if ( minimum < y1 && y1 < maximum )
            xs.push_back( Intersection( t1, this ) );
    }

    intersect_caps( r, xs );
    return xs;
}

void Cylinder::intersect_caps( const Ray& r, IntersectionList& xs ) const
{
    // open cylinders have no caps, and rays parallel to the caps miss them
    if ( !closed || std::fabs( r.d.y ) < EPSILON )
        return;

    real_t t = ( minimum - r.e.y ) / r.d.y;
    if ( check_cap( r, t ) )
        xs.push_back( Intersection( t, this ) );

    t = ( maximum - r.e.y ) / r.d.y;
    if ( check_cap( r, t ) )
        xs.push_back( Intersection( t, this ) );
}

Tuple Cylinder::local_normal( const Tuple& point, const Intersection& ) const
{
    real_t dist = point.x * point.x + point.z * point.z;

    if ( dist < 1 && point.y >= maximum - EPSILON )
        return Tuple::vector( 0, 1, 0 );
    if ( dist < 1 && point.y <= minimum + EPSILON )
        return Tuple::vector( 0, -1, 0 );
    return Tuple::vector( point.x, 0, point.z );
}

BoundingBox Cylinder::local_bounds() const
{
    return BoundingBox( Tuple::point( -1, minimum, -1 ), Tuple::point( 1, maximum, 1 ) );
}

} /* lumen */
