/**
 * @file group.hpp
 * @brief Class definition for Group.
 */

#ifndef _LUMEN_SCENE_GROUP_HPP_
#define _LUMEN_SCENE_GROUP_HPP_

#include "scene/shape.hpp"
#include <vector>

namespace lumen {

/**
 * An ordered collection of shapes sharing a transform. A group has no
 * surface of its own; rays are tested against the cached bounds of the
 * children first and only then passed down.
 *
 * Children are borrowed from the arena that created them. A shape can be
 * the child of at most one group.
 */
class Group : public Shape
{
public:

    typedef std::vector<Shape*> ChildList;

    Group();
    virtual ~Group();

    /**
     * Appends a child and links it back to this group.
     * Throws std::logic_error if the child already has a parent or is this
     * group itself.
     */
    void add_child( Shape* child );

    const ChildList& children() const { return child_list; }
    bool empty() const { return child_list.empty(); }

    virtual bool includes( const Shape* other ) const;
    virtual void refresh_bounds();

    virtual IntersectionList local_intersections( const Ray& r ) const;
    // groups have no surface; always throws std::logic_error
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const;
    virtual BoundingBox local_bounds() const;

private:

    ChildList child_list;
    BoundingBox cached_bounds;
};

} /* lumen */

#endif /* _LUMEN_SCENE_GROUP_HPP_ */
