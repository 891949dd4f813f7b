#include "math/tuple.hpp"

#include <ostream>

namespace lumen {

Tuple& Tuple::operator+=( const Tuple& rhs )
{
    x += rhs.x;
    y += rhs.y;
    z += rhs.z;
    w += rhs.w;
    return *this;
}

Tuple& Tuple::operator-=( const Tuple& rhs )
{
    x -= rhs.x;
    y -= rhs.y;
    z -= rhs.z;
    w -= rhs.w;
    return *this;
}

Tuple& Tuple::operator*=( real_t s )
{
    x *= s;
    y *= s;
    z *= s;
    w *= s;
    return *this;
}

Tuple& Tuple::operator/=( real_t s )
{
    real_t inv = real_t( 1 ) / s;
    return *this *= inv;
}

Tuple operator+( const Tuple& lhs, const Tuple& rhs )
{
    return Tuple( lhs.x + rhs.x, lhs.y + rhs.y, lhs.z + rhs.z, lhs.w + rhs.w );
}

Tuple operator-( const Tuple& lhs, const Tuple& rhs )
{
    return Tuple( lhs.x - rhs.x, lhs.y - rhs.y, lhs.z - rhs.z, lhs.w - rhs.w );
}

Tuple operator*( const Tuple& lhs, real_t s )
{
    return Tuple( lhs.x * s, lhs.y * s, lhs.z * s, lhs.w * s );
}

Tuple operator*( real_t s, const Tuple& rhs )
{
    return rhs * s;
}

Tuple operator/( const Tuple& lhs, real_t s )
{
    return Tuple( lhs.x / s, lhs.y / s, lhs.z / s, lhs.w / s );
}

bool operator==( const Tuple& lhs, const Tuple& rhs )
{
    return approx_equal( lhs.x, rhs.x ) &&
           approx_equal( lhs.y, rhs.y ) &&
           approx_equal( lhs.z, rhs.z ) &&
           approx_equal( lhs.w, rhs.w );
}

bool operator!=( const Tuple& lhs, const Tuple& rhs )
{
    return !( lhs == rhs );
}

std::ostream& operator<<( std::ostream& os, const Tuple& t )
{
    return os << "(" << t.x << ", " << t.y << ", " << t.z << ", " << t.w << ")";
}

real_t magnitude( const Tuple& t )
{
    return std::sqrt( t.x * t.x + t.y * t.y + t.z * t.z + t.w * t.w );
}

Tuple normalize( const Tuple& t )
{
    return t / magnitude( t );
}

real_t dot( const Tuple& lhs, const Tuple& rhs )
{
    return lhs.x * rhs.x + lhs.y * rhs.y + lhs.z * rhs.z + lhs.w * rhs.w;
}

Tuple cross( const Tuple& lhs, const Tuple& rhs )
{
    return Tuple::vector( lhs.y * rhs.z - lhs.z * rhs.y,
                          lhs.z * rhs.x - lhs.x * rhs.z,
                          lhs.x * rhs.y - lhs.y * rhs.x );
}

Tuple reflect( const Tuple& v, const Tuple& n )
{
    return v - n * 2 * dot( v, n );
}

} /* lumen */
