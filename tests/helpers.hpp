#ifndef _LUMEN_TESTS_HELPERS_HPP_
#define _LUMEN_TESTS_HELPERS_HPP_

#include "math/color.hpp"
#include "math/tuple.hpp"
#include "scene/arena.hpp"
#include "scene/sphere.hpp"
#include "scene/world.hpp"

#include <catch2/catch.hpp>

namespace lumen {

// for published values rounded to 4 or 5 decimals
inline void require_tuple( const Tuple& actual, const Tuple& expected, double margin = 1e-4 )
{
    INFO( "actual " << actual << ", expected " << expected );
    REQUIRE( actual.x == Approx( expected.x ).margin( margin ) );
    REQUIRE( actual.y == Approx( expected.y ).margin( margin ) );
    REQUIRE( actual.z == Approx( expected.z ).margin( margin ) );
    REQUIRE( actual.w == Approx( expected.w ).margin( margin ) );
}

inline void require_color( const Color3& actual, const Color3& expected, double margin = 1e-4 )
{
    INFO( "actual " << actual << ", expected " << expected );
    REQUIRE( actual.r == Approx( expected.r ).margin( margin ) );
    REQUIRE( actual.g == Approx( expected.g ).margin( margin ) );
    REQUIRE( actual.b == Approx( expected.b ).margin( margin ) );
}

/*
Light at (-10, 10, -10); a unit sphere with a greenish matte material and a
plain sphere of radius 0.5 inside it.
*/
struct DefaultWorld
{
    ShapeArena arena;
    World world;
    Sphere* outer;
    Sphere* inner;

    DefaultWorld()
    {
        world.light = PointLight( Tuple::point( -10, 10, -10 ), Color3( 1, 1, 1 ) );

        outer = arena.create<Sphere>();
        outer->material().color = Color3( 0.8, 1.0, 0.6 );
        outer->material().diffuse = 0.7;
        outer->material().specular = 0.2;

        inner = arena.create<Sphere>();
        inner->set_transform( Matrix::scaling( 0.5, 0.5, 0.5 ) );

        world.add_object( outer );
        world.add_object( inner );
    }
};

} /* lumen */

#endif /* _LUMEN_TESTS_HELPERS_HPP_ */
