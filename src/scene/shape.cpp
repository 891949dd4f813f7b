/**
 * @file shape.cpp
 * @brief Space conversions shared by every shape.
 */

#include "scene/shape.hpp"
#include "scene/group.hpp"
#include "light/point.hpp"

namespace lumen {

Shape::Shape()
    : casts_shadow( true ),
      shape_id( 0 ),
      parent_ptr( 0 ),
      transform_( Matrix::identity( 4 ) ) { }

Shape::~Shape() { }

Tuple Shape::world_to_object( const Tuple& point ) const
{
    Tuple parent_point = parent_ptr ? parent_ptr->world_to_object( point ) : point;
    return transform_.inverse() * parent_point;
}

Tuple Shape::normal_to_world( const Tuple& normal ) const
{
    Tuple n = transform_.inverse().transpose() * normal;
    // the translation leaks into w, and normals are directions
    n.w = 0;
    n = normalize( n );

    if ( parent_ptr )
        return parent_ptr->normal_to_world( n );
    return n;
}

Tuple Shape::normal( const Tuple& world_point, const Intersection& hit ) const
{
    Tuple local_point = world_to_object( world_point );
    Tuple local_n = local_normal( local_point, hit );
    return normal_to_world( local_n );
}

IntersectionList Shape::intersections( const Ray& r ) const
{
    return local_intersections( r.transform( transform_.inverse() ) );
}

BoundingBox Shape::bounds() const
{
    return local_bounds().transform( transform_ );
}

Color3 Shape::lighting( const PointLight& light,
                        const Tuple& world_point,
                        const Tuple& eyev,
                        const Tuple& normalv,
                        bool in_shadow ) const
{
    Tuple object_point = world_to_object( world_point );
    return material_.lighting( light, object_point, world_point, eyev, normalv, in_shadow );
}

bool Shape::includes( const Shape* other ) const
{
    return other && other->id() == id();
}

void Shape::refresh_bounds() { }

bool operator==( const Shape& lhs, const Shape& rhs )
{
    return lhs.id() == rhs.id();
}

bool operator!=( const Shape& lhs, const Shape& rhs )
{
    return !( lhs == rhs );
}

} /* lumen */
