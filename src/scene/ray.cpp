#include "scene/ray.hpp"

namespace lumen {

Ray::Ray()
    : e( Tuple::Origin() ), d( Tuple::vector( 0, 0, 1 ) ) {}

Ray::Ray( const Tuple& e, const Tuple& d )
{
    this->e = e;
    this->d = d;
}

Tuple Ray::position( real_t t ) const
{
    return e + d * t;
}

Ray Ray::transform( const Matrix& mat ) const
{
    return Ray( mat * e, mat * d );
}

} /* lumen */
