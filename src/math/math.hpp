/**
 * @file math.hpp
 * @brief General math declarations and definitions.
 */

#ifndef _LUMEN_MATH_MATH_HPP_
#define _LUMEN_MATH_MATH_HPP_

#include <algorithm>
#include <cmath>
#include <limits>

namespace lumen {

// floating point precision set by this typedef
typedef double real_t;

// since the standard library happily does not provide one
#define PI 3.141592653589793238

// tolerance of every approximate comparison (tuples, matrices, colors)
static const real_t EPSILON = 1e-5;

// distance a hit point is nudged along the normal for secondary rays
static const real_t SHADOW_EPSILON = 1e-4;

static const real_t INFINITY_REAL = std::numeric_limits<real_t>::infinity();

template<typename T>
inline T clamp( T val, T min, T max )
{
    return std::min( max, std::max( min, val ) );
}

inline bool approx_equal( real_t a, real_t b )
{
    // infinities compare equal to themselves only
    if ( a == b )
        return true;
    return std::fabs( a - b ) < EPSILON;
}

// floor() that treats values within EPSILON below an integer as that integer
inline real_t denoised_floor( real_t val )
{
    return std::floor( val + EPSILON );
}

} /* lumen */

#endif /* _LUMEN_MATH_MATH_HPP_ */
