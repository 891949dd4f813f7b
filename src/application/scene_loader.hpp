/**
 * @file scene_loader.hpp
 * @brief Loading scenes from XML files.
 */

#ifndef _LUMEN_APPLICATION_SCENE_LOADER_HPP_
#define _LUMEN_APPLICATION_SCENE_LOADER_HPP_

#include <stdexcept>
#include <string>

namespace lumen {

class Scene;

/**
 * A malformed or inconsistent scene description. The message has already
 * been printed, with the position of the offending element, by the time
 * this is thrown.
 */
class SceneLoadError : public std::runtime_error
{
public:
    explicit SceneLoadError( const std::string& what )
        : std::runtime_error( what ) { }
};

/**
 * Loads the scene in the given file into scene, which is reset first.
 * @return true on success. On failure an error is printed, the scene is
 *  left empty and false is returned.
 */
bool load_scene( Scene* scene, const char* filename );

// same as load_scene, reading the XML from a string
bool load_scene_from_string( Scene* scene, const char* text );

} /* lumen */

#endif /* _LUMEN_APPLICATION_SCENE_LOADER_HPP_ */
