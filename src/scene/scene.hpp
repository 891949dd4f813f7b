/**
* @file scene.hpp
* @brief Class definition for scenes.
*/

#ifndef _LUMEN_SCENE_SCENE_HPP_
#define _LUMEN_SCENE_SCENE_HPP_

#include "scene/arena.hpp"
#include "scene/camera.hpp"
#include "scene/world.hpp"
#include "material/pattern.hpp"
#include <vector>

namespace lumen {

    /**
    * The container class for everything a render needs: the shapes, the
    * patterns their materials refer to, the world listing the top-level
    * shapes, and the camera.
    */
    class Scene
    {
    public:

        /// the camera
        Camera camera;

        /// the light and the top-level shapes
        World world;

        /// Creates a new empty scene.
        Scene();

        /// Destroys this scene. Deletes every shape and pattern.
        ~Scene();

        /// creates and owns shapes
        ShapeArena& shapes() { return arena; }
        const ShapeArena& shapes() const { return arena; }

        /// Takes ownership of p, which must be heap allocated.
        void add_pattern( Pattern* p );
        size_t num_patterns() const;

        /// Clears the scene: no shapes or patterns, default light and camera.
        void reset();

        /// Renders the world through the camera.
        Canvas render() const;

    private:

        typedef std::vector< Pattern* > PatternList;

        ShapeArena arena;

        // all patterns used by materials. deleted in dctor, so should be allocated on heap.
        PatternList patterns;

        // no meaningful assignment or copy
        Scene(const Scene&);
        Scene& operator=(const Scene&);
    };

} /* lumen */

#endif /* _LUMEN_SCENE_SCENE_HPP_ */
