/**
 * @file world.hpp
 * @brief The light and the top-level shapes, plus the shading recursion.
 */

#ifndef _LUMEN_SCENE_WORLD_HPP_
#define _LUMEN_SCENE_WORLD_HPP_

#include "scene/shape.hpp"
#include "light/point.hpp"
#include <vector>

namespace lumen {

// maximum recursion depth of a camera ray
#define MAX_REFLECTIONS 5

/**
 * A single point light and a flat list of shapes, any of which may be a
 * group. Shapes are borrowed; the world never deletes them.
 *
 * Every query is const, so one world can be shaded from many threads at
 * once.
 */
class World
{
public:

    typedef std::vector<Shape*> ShapeList;

    PointLight light;

    World();
    ~World();

    // adds a top-level shape and rebuilds the cached bounds of its subtree
    void add_object( Shape* shape );
    const ShapeList& objects() const { return shapes; }

    // forgets every shape and restores the default light
    void reset();

    // the union of the intersections of every shape, in ascending t
    IntersectionList intersections( const Ray& r ) const;

    /**
     * The color of a prepared hit: surface lighting, plus reflection and
     * refraction while recursion depth remains.
     */
    Color3 shade_hit( const IntersectionState& comps, int remaining ) const;

    // prepares hit (one of xs, which must be sorted) and shades it
    Color3 shade_hit( const Intersection& hit, const Ray& r,
                      const IntersectionList& xs, int remaining ) const;

    // the color seen along r, black if nothing is hit
    Color3 color_at( const Ray& r, int remaining ) const;

    Color3 reflected_color( const IntersectionState& comps, int remaining ) const;
    Color3 refracted_color( const IntersectionState& comps, int remaining ) const;

    // true if a shadow-casting shape lies between point and the light
    bool is_shadowed( const Tuple& point ) const;

private:

    ShapeList shapes;

    // no meaningful assignment or copy
    World( const World& );
    World& operator=( const World& );
};

} /* lumen */

#endif /* _LUMEN_SCENE_WORLD_HPP_ */
