/**
 * @file group.cpp
 * @brief Bounds caching and child traversal for Group.
 */

#include "scene/group.hpp"

#include <stdexcept>

namespace lumen {

Group::Group() { }

Group::~Group() { }

void Group::add_child( Shape* child )
{
    if ( child == this )
        throw std::logic_error( "a group cannot contain itself" );
    if ( child->parent_ptr )
        throw std::logic_error( "shape already belongs to a group" );

    child->parent_ptr = this;
    child_list.push_back( child );
    cached_bounds.AddBox( child->bounds() );

    // ancestors cached their bounds before this child arrived
    const Shape* node = this;
    for ( Group* g = parent_ptr; g; g = g->parent_ptr ) {
        g->cached_bounds.AddBox( node->bounds() );
        node = g;
    }
}

bool Group::includes( const Shape* other ) const
{
    if ( Shape::includes( other ) )
        return true;

    for ( size_t i = 0; i < child_list.size(); i++ ) {
        if ( child_list[i]->includes( other ) )
            return true;
    }
    return false;
}

void Group::refresh_bounds()
{
    cached_bounds = BoundingBox();
    for ( size_t i = 0; i < child_list.size(); i++ ) {
        child_list[i]->refresh_bounds();
        cached_bounds.AddBox( child_list[i]->bounds() );
    }
}

IntersectionList Group::local_intersections( const Ray& r ) const
{
    IntersectionList xs;
    if ( !cached_bounds.hit( r ) )
        return xs;

    for ( size_t i = 0; i < child_list.size(); i++ ) {
        IntersectionList child_xs = child_list[i]->intersections( r );
        xs.insert( xs.end(), child_xs.begin(), child_xs.end() );
    }
    return xs;
}

Tuple Group::local_normal( const Tuple&, const Intersection& ) const
{
    throw std::logic_error( "groups have no surface normal" );
}

BoundingBox Group::local_bounds() const
{
    return cached_bounds;
}

} /* lumen */
