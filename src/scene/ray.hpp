/**
 * @file ray.hpp
 * @brief A ray: origin plus direction.
 */

#ifndef _LUMEN_SCENE_RAY_HPP_
#define _LUMEN_SCENE_RAY_HPP_

#include "math/tuple.hpp"
#include "math/matrix.hpp"

namespace lumen {

class Ray
{
public:
    // the origin of the ray (a point)
    Tuple e;
    // the direction of the ray (a vector, not necessarily normalized)
    Tuple d;

    Ray();
    Ray( const Tuple& e, const Tuple& d );

    // the point at parameter t
    Tuple position( real_t t ) const;

    // the ray with both origin and direction multiplied by mat
    Ray transform( const Matrix& mat ) const;
};

} /* lumen */

#endif /* _LUMEN_SCENE_RAY_HPP_ */
