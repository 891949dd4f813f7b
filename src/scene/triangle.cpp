/**
* @file triangle.cpp
* @brief Function definitions for the Triangle classes.
*/

#include "scene/triangle.hpp"

namespace lumen {

    Triangle::Triangle( const Tuple& p1, const Tuple& p2, const Tuple& p3 )
        : p1( p1 ), p2( p2 ), p3( p3 ),
          e1( p2 - p1 ), e2( p3 - p1 )
    {
        face_normal = normalize( cross( e2, e1 ) );
    }

    Triangle::~Triangle() { }

    bool Triangle::hit( const Ray& r, real_t* t, real_t* u, real_t* v ) const
    {
        Tuple dir_cross_e2 = cross( r.d, e2 );
        real_t det = dot( e1, dir_cross_e2 );
        if ( std::fabs( det ) < EPSILON )
            return false;

        real_t f = 1.0 / det;
        Tuple p1_to_origin = r.e - p1;
        real_t bu = f * dot( p1_to_origin, dir_cross_e2 );
        if ( bu < 0 || bu > 1 )
            return false;

        Tuple origin_cross_e1 = cross( p1_to_origin, e1 );
        real_t bv = f * dot( r.d, origin_cross_e1 );
        if ( bv < 0 || bu + bv > 1 )
            return false;

        *t = f * dot( e2, origin_cross_e1 );
        *u = bu;
        *v = bv;
        return true;
    }

    IntersectionList Triangle::local_intersections( const Ray& r ) const
    {
        IntersectionList xs;
        real_t t, u, v;
        if ( hit( r, &t, &u, &v ) )
            xs.push_back( Intersection( t, this ) );
        return xs;
    }

    Tuple Triangle::local_normal( const Tuple&, const Intersection& ) const
    {
        return face_normal;
    }

    BoundingBox Triangle::local_bounds() const
    {
        BoundingBox box;
        box.AddPoint( p1 );
        box.AddPoint( p2 );
        box.AddPoint( p3 );
        return box;
    }

    SmoothTriangle::SmoothTriangle( const Tuple& p1, const Tuple& p2, const Tuple& p3,
                                    const Tuple& n1, const Tuple& n2, const Tuple& n3 )
        : Triangle( p1, p2, p3 ), n1( n1 ), n2( n2 ), n3( n3 ) { }

    SmoothTriangle::~SmoothTriangle() { }

    IntersectionList SmoothTriangle::local_intersections( const Ray& r ) const
    {
        IntersectionList xs;
        real_t t, u, v;
        if ( hit( r, &t, &u, &v ) )
            xs.push_back( Intersection( t, this, u, v ) );
        return xs;
    }

    Tuple SmoothTriangle::local_normal( const Tuple&, const Intersection& hit ) const
    {
        return n2 * hit.u + n3 * hit.v + n1 * ( 1 - hit.u - hit.v );
    }

} /* lumen */
