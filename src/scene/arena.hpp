/**
 * @file arena.hpp
 * @brief Owner of every shape in a scene.
 */

#ifndef _LUMEN_SCENE_ARENA_HPP_
#define _LUMEN_SCENE_ARENA_HPP_

#include "scene/shape.hpp"
#include <vector>

namespace lumen {

/**
 * Creates and owns shapes. Each shape gets the next identifier, starting at
 * 1, so identifiers are unique within an arena. Groups and worlds only hold
 * borrowed pointers, which stay valid until the arena is reset or destroyed.
 */
class ShapeArena
{
public:

    ShapeArena();
    ~ShapeArena();

    template<typename T>
    T* create()
    {
        return adopt( new T() );
    }

    template<typename T, typename A1>
    T* create( const A1& a1 )
    {
        return adopt( new T( a1 ) );
    }

    template<typename T, typename A1, typename A2>
    T* create( const A1& a1, const A2& a2 )
    {
        return adopt( new T( a1, a2 ) );
    }

    template<typename T, typename A1, typename A2, typename A3>
    T* create( const A1& a1, const A2& a2, const A3& a3 )
    {
        return adopt( new T( a1, a2, a3 ) );
    }

    template<typename T, typename A1, typename A2, typename A3,
             typename A4, typename A5, typename A6>
    T* create( const A1& a1, const A2& a2, const A3& a3,
               const A4& a4, const A5& a5, const A6& a6 )
    {
        return adopt( new T( a1, a2, a3, a4, a5, a6 ) );
    }

    size_t size() const { return shapes.size(); }

    // deletes every shape; identifiers start over at 1
    void reset();

private:

    template<typename T>
    T* adopt( T* shape )
    {
        shapes.push_back( shape );
        shape->shape_id = ++last_id;
        return shape;
    }

    std::vector<Shape*> shapes;
    size_t last_id;

    // no meaningful assignment or copy
    ShapeArena( const ShapeArena& );
    ShapeArena& operator=( const ShapeArena& );
};

} /* lumen */

#endif /* _LUMEN_SCENE_ARENA_HPP_ */
