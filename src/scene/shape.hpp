/**
 * @file shape.hpp
 * @brief The abstract shape every scene object derives from.
 */

#ifndef _LUMEN_SCENE_SHAPE_HPP_
#define _LUMEN_SCENE_SHAPE_HPP_

#include "math/matrix.hpp"
#include "math/color.hpp"
#include "material/material.hpp"
#include "scene/BoundingBox.hpp"
#include "scene/intersection.hpp"
#include "scene/ray.hpp"

namespace lumen {

class Group;
class PointLight;
class ShapeArena;

/**
 * A scene object. Variants only provide the object-space geometry
 * (local_intersections, local_normal, local_bounds); everything that deals
 * with coordinate spaces is implemented once here.
 *
 * Shapes are created and owned by a ShapeArena, which also assigns the
 * identifier. The parent link is set by Group::add_child and is only ever
 * read, to walk outward through the enclosing groups' transforms.
 */
class Shape
{
public:

    virtual ~Shape();

    size_t id() const { return shape_id; }
    const Group* parent() const { return parent_ptr; }

    // object space -> parent space
    const Matrix& transform() const { return transform_; }
    void set_transform( const Matrix& mat ) { transform_ = mat; }

    const Material& material() const { return material_; }
    Material& material() { return material_; }
    void set_material( const Material& mat ) { material_ = mat; }

    // shapes that don't cast shadows are skipped by shadow rays
    bool casts_shadow;

    // world point -> object point, through every enclosing group
    Tuple world_to_object( const Tuple& point ) const;

    // object normal -> world normal, through every enclosing group
    Tuple normal_to_world( const Tuple& normal ) const;

    /**
     * The world-space unit normal at a world-space point. The intersection
     * is only used by shapes that interpolate normals (smooth triangles).
     */
    Tuple normal( const Tuple& world_point, const Intersection& hit ) const;

    // intersections of a ray given in parent space, unsorted
    IntersectionList intersections( const Ray& r ) const;

    // the object-space bounds, transformed into parent space
    BoundingBox bounds() const;

    // Phong lighting of a world-space point, with the pattern evaluated in object space
    Color3 lighting( const PointLight& light,
                     const Tuple& world_point,
                     const Tuple& eyev,
                     const Tuple& normalv,
                     bool in_shadow ) const;

    // true if other is this shape or, for groups, one of its descendants
    virtual bool includes( const Shape* other ) const;

    // rebuilds cached bounds of composite shapes; nothing to do for primitives
    virtual void refresh_bounds();

    virtual IntersectionList local_intersections( const Ray& r ) const = 0;
    virtual Tuple local_normal( const Tuple& point, const Intersection& hit ) const = 0;
    virtual BoundingBox local_bounds() const = 0;

protected:

    Shape();

private:

    friend class Group;
    friend class ShapeArena;

    size_t shape_id;
    Group* parent_ptr;
    Matrix transform_;
    Material material_;

    // no meaningful assignment or copy
    Shape( const Shape& );
    Shape& operator=( const Shape& );
};

// identity: same identifier
bool operator==( const Shape& lhs, const Shape& rhs );
bool operator!=( const Shape& lhs, const Shape& rhs );

} /* lumen */

#endif /* _LUMEN_SCENE_SHAPE_HPP_ */
