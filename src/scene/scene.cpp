/**
* @file scene.cpp
* @brief Function definitions for scenes.
*/

#include "scene/scene.hpp"

namespace lumen {

    Scene::Scene()
    {
        reset();
    }

    Scene::~Scene()
    {
        reset();
    }

    void Scene::add_pattern( Pattern* p )
    {
        patterns.push_back( p );
    }

    size_t Scene::num_patterns() const
    {
        return patterns.size();
    }

    void Scene::reset()
    {
        // the world only borrows shapes, so forget them before deleting
        world.reset();
        arena.reset();

        for ( PatternList::iterator i = patterns.begin(); i != patterns.end(); ++i ) {
            delete *i;
        }
        patterns.clear();

        camera = Camera();
    }

    Canvas Scene::render() const
    {
        return camera.render( world );
    }

} /* lumen */
