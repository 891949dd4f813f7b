/**
 * @file tuple.hpp
 * @brief Homogeneous 4-component points and vectors.
 */

#ifndef _LUMEN_MATH_TUPLE_HPP_
#define _LUMEN_MATH_TUPLE_HPP_

#include "math/math.hpp"
#include <cstddef>
#include <iosfwd>
#include <stdexcept>

namespace lumen {

/**
 * A homogeneous tuple. w == 1 marks a point, w == 0 marks a vector.
 * Mixing the two incorrectly (e.g. adding two points) is allowed; keeping
 * the semantics straight is the caller's job.
 */
class Tuple
{
public:

    real_t x, y, z, w;

    Tuple() : x( 0 ), y( 0 ), z( 0 ), w( 0 ) { }
    Tuple( real_t x, real_t y, real_t z, real_t w )
        : x( x ), y( y ), z( z ), w( w ) { }

    static Tuple point( real_t x, real_t y, real_t z )
    {
        return Tuple( x, y, z, 1 );
    }

    static Tuple vector( real_t x, real_t y, real_t z )
    {
        return Tuple( x, y, z, 0 );
    }

    static Tuple Origin()
    {
        return Tuple( 0, 0, 0, 1 );
    }

    bool is_point() const { return w == 1.0; }
    bool is_vector() const { return w == 0.0; }

    // 0..3 select x, y, z, w; anything else throws std::out_of_range
    const real_t& operator[]( size_t i ) const
    {
        switch ( i ) {
        case 0: return x;
        case 1: return y;
        case 2: return z;
        case 3: return w;
        default: throw std::out_of_range( "tuple index" );
        }
    }

    real_t& operator[]( size_t i )
    {
        return const_cast<real_t&>( static_cast<const Tuple&>( *this )[i] );
    }

    Tuple operator-() const
    {
        return Tuple( -x, -y, -z, -w );
    }

    Tuple& operator+=( const Tuple& rhs );
    Tuple& operator-=( const Tuple& rhs );
    Tuple& operator*=( real_t s );
    Tuple& operator/=( real_t s );
};

Tuple operator+( const Tuple& lhs, const Tuple& rhs );
Tuple operator-( const Tuple& lhs, const Tuple& rhs );
Tuple operator*( const Tuple& lhs, real_t s );
Tuple operator*( real_t s, const Tuple& rhs );
Tuple operator/( const Tuple& lhs, real_t s );

// component-wise, within EPSILON
bool operator==( const Tuple& lhs, const Tuple& rhs );
bool operator!=( const Tuple& lhs, const Tuple& rhs );

std::ostream& operator<<( std::ostream& os, const Tuple& t );

// Euclidean norm over all four components
real_t magnitude( const Tuple& t );

// Undefined (NaN components) for a zero tuple; callers must not normalize one.
Tuple normalize( const Tuple& t );

real_t dot( const Tuple& lhs, const Tuple& rhs );

// 3-component cross product, the result is always a vector
Tuple cross( const Tuple& lhs, const Tuple& rhs );

// reflects v about the normal n
Tuple reflect( const Tuple& v, const Tuple& n );

} /* lumen */

#endif /* _LUMEN_MATH_TUPLE_HPP_ */
