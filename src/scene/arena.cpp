#include "scene/arena.hpp"

namespace lumen {

ShapeArena::ShapeArena() : last_id( 0 ) { }

ShapeArena::~ShapeArena()
{
    reset();
}

void ShapeArena::reset()
{
    for ( size_t i = 0; i < shapes.size(); i++ )
        delete shapes[i];
    shapes.clear();
    last_id = 0;
}

} /* lumen */
