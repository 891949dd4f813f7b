/**
 * @file color.hpp
 * @brief An RGB color.
 */

#ifndef _LUMEN_MATH_COLOR_HPP_
#define _LUMEN_MATH_COLOR_HPP_

#include "math/math.hpp"
#include <iosfwd>

namespace lumen {

/**
 * An RGB color with real-valued components. Components are not clamped
 * until the color is converted to bytes.
 */
class Color3
{
public:

    real_t r, g, b;

    Color3() : r( 0 ), g( 0 ), b( 0 ) { }
    Color3( real_t r, real_t g, real_t b ) : r( r ), g( g ), b( b ) { }

    static Color3 Black() { return Color3( 0, 0, 0 ); }
    static Color3 White() { return Color3( 1, 1, 1 ); }

    Color3& operator+=( const Color3& rhs );
    Color3& operator-=( const Color3& rhs );
    Color3& operator*=( const Color3& rhs );
    Color3& operator*=( real_t s );
    Color3& operator/=( real_t s );

    /**
     * Stores the color into the first three bytes of arr, each component
     * clamped to [0, 1] and scaled to [0, 255] with rounding.
     */
    void to_array( unsigned char arr[3] ) const;
};

Color3 operator+( const Color3& lhs, const Color3& rhs );
Color3 operator-( const Color3& lhs, const Color3& rhs );
// Hadamard product
Color3 operator*( const Color3& lhs, const Color3& rhs );
Color3 operator*( const Color3& lhs, real_t s );
Color3 operator*( real_t s, const Color3& rhs );
Color3 operator/( const Color3& lhs, real_t s );

bool operator==( const Color3& lhs, const Color3& rhs );
bool operator!=( const Color3& lhs, const Color3& rhs );

std::ostream& operator<<( std::ostream& os, const Color3& c );

// clamps to [0, 1] and scales to a byte value, rounding half up
int color_component_byte( real_t component );

} /* lumen */

#endif /* _LUMEN_MATH_COLOR_HPP_ */
