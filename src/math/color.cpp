#include "math/color.hpp"

#include <ostream>

namespace lumen {

Color3& Color3::operator+=( const Color3& rhs )
{
    r += rhs.r;
    g += rhs.g;
    b += rhs.b;
    return *this;
}

Color3& Color3::operator-=( const Color3& rhs )
{
    r -= rhs.r;
    g -= rhs.g;
    b -= rhs.b;
    return *this;
}

Color3& Color3::operator*=( const Color3& rhs )
{
    r *= rhs.r;
    g *= rhs.g;
    b *= rhs.b;
    return *this;
}

Color3& Color3::operator*=( real_t s )
{
    r *= s;
    g *= s;
    b *= s;
    return *this;
}

Color3& Color3::operator/=( real_t s )
{
    r /= s;
    g /= s;
    b /= s;
    return *this;
}

void Color3::to_array( unsigned char arr[3] ) const
{
    arr[0] = (unsigned char) color_component_byte( r );
    arr[1] = (unsigned char) color_component_byte( g );
    arr[2] = (unsigned char) color_component_byte( b );
}

Color3 operator+( const Color3& lhs, const Color3& rhs )
{
    return Color3( lhs.r + rhs.r, lhs.g + rhs.g, lhs.b + rhs.b );
}

Color3 operator-( const Color3& lhs, const Color3& rhs )
{
    return Color3( lhs.r - rhs.r, lhs.g - rhs.g, lhs.b - rhs.b );
}

Color3 operator*( const Color3& lhs, const Color3& rhs )
{
    return Color3( lhs.r * rhs.r, lhs.g * rhs.g, lhs.b * rhs.b );
}

Color3 operator*( const Color3& lhs, real_t s )
{
    return Color3( lhs.r * s, lhs.g * s, lhs.b * s );
}

Color3 operator*( real_t s, const Color3& rhs )
{
    return rhs * s;
}

Color3 operator/( const Color3& lhs, real_t s )
{
    return Color3( lhs.r / s, lhs.g / s, lhs.b / s );
}

bool operator==( const Color3& lhs, const Color3& rhs )
{
    return approx_equal( lhs.r, rhs.r ) &&
           approx_equal( lhs.g, rhs.g ) &&
           approx_equal( lhs.b, rhs.b );
}

bool operator!=( const Color3& lhs, const Color3& rhs )
{
    return !( lhs == rhs );
}

std::ostream& operator<<( std::ostream& os, const Color3& c )
{
    return os << "(" << c.r << ", " << c.g << ", " << c.b << ")";
}

int color_component_byte( real_t component )
{
    real_t scaled = clamp( component, real_t( 0 ), real_t( 1 ) ) * 255;
    return (int) std::floor( scaled + 0.5 );
}

} /* lumen */
