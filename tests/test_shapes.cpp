#include "scene/arena.hpp"
#include "scene/cube.hpp"
#include "scene/cylinder.hpp"
#include "scene/plane.hpp"
#include "scene/sphere.hpp"
#include "scene/triangle.hpp"
#include "helpers.hpp"

#include <catch2/catch.hpp>
#include <cmath>

using namespace lumen;

// the world normal of a shape with no interpolation data
static Tuple normal_at( const Shape* s, const Tuple& world_point )
{
    return s->normal( world_point, Intersection( 0, s ) );
}

TEST_CASE( "the arena assigns sequential identifiers", "[shape]" )
{
    ShapeArena arena;
    Sphere* a = arena.create<Sphere>();
    Sphere* b = arena.create<Sphere>();

    REQUIRE( a->id() == 1 );
    REQUIRE( b->id() == 2 );
    REQUIRE( *a != *b );
    REQUIRE( arena.size() == 2 );

    arena.reset();
    REQUIRE( arena.size() == 0 );
    REQUIRE( arena.create<Cube>()->id() == 1 );
}

TEST_CASE( "a new shape has default state", "[shape]" )
{
    ShapeArena arena;
    Sphere* s = arena.create<Sphere>();

    REQUIRE( s->transform() == Matrix::identity( 4 ) );
    REQUIRE( s->material() == Material() );
    REQUIRE( s->casts_shadow );
    REQUIRE_FALSE( s->parent() );

    s->set_transform( Matrix::translation( 2, 3, 4 ) );
    REQUIRE( s->transform() == Matrix::translation( 2, 3, 4 ) );

    Material m;
    m.ambient = 1;
    s->set_material( m );
    REQUIRE( s->material() == m );
}

TEST_CASE( "ray/sphere intersection", "[shape][sphere]" )
{
    ShapeArena arena;
    Sphere* s = arena.create<Sphere>();

    SECTION( "two points" ) {
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 0, -5 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 2 );
        REQUIRE( xs[0].t == Approx( 4.0 ) );
        REQUIRE( xs[1].t == Approx( 6.0 ) );
        REQUIRE( xs[0].object == s );
        REQUIRE( xs[1].object == s );
    }

    SECTION( "a tangent" ) {
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 1, -5 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 2 );
        REQUIRE( xs[0].t == Approx( 5.0 ) );
        REQUIRE( xs[1].t == Approx( 5.0 ) );
    }

    SECTION( "a miss" ) {
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 2, -5 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.empty() );
    }

    SECTION( "a ray originating inside" ) {
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 0, 0 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 2 );
        REQUIRE( xs[0].t == Approx( -1.0 ) );
        REQUIRE( xs[1].t == Approx( 1.0 ) );
    }

    SECTION( "a sphere behind the ray" ) {
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 0, 5 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 2 );
        REQUIRE( xs[0].t == Approx( -6.0 ) );
        REQUIRE( xs[1].t == Approx( -4.0 ) );
    }

    SECTION( "a scaled sphere" ) {
        s->set_transform( Matrix::scaling( 2, 2, 2 ) );
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 0, -5 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 2 );
        REQUIRE( xs[0].t == Approx( 3.0 ) );
        REQUIRE( xs[1].t == Approx( 7.0 ) );
    }

    SECTION( "a translated sphere" ) {
        s->set_transform( Matrix::translation( 5, 0, 0 ) );
        IntersectionList xs = s->intersections( Ray( Tuple::point( 0, 0, -5 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.empty() );
    }
}

TEST_CASE( "sphere normals", "[shape][sphere]" )
{
    ShapeArena arena;
    Sphere* s = arena.create<Sphere>();
    real_t third = std::sqrt( 3.0 ) / 3;

    REQUIRE( normal_at( s, Tuple::point( 1, 0, 0 ) ) == Tuple::vector( 1, 0, 0 ) );
    REQUIRE( normal_at( s, Tuple::point( 0, 1, 0 ) ) == Tuple::vector( 0, 1, 0 ) );
    REQUIRE( normal_at( s, Tuple::point( 0, 0, 1 ) ) == Tuple::vector( 0, 0, 1 ) );

    Tuple n = normal_at( s, Tuple::point( third, third, third ) );
    REQUIRE( n == Tuple::vector( third, third, third ) );
    REQUIRE( n == normalize( n ) );

    SECTION( "translated" ) {
        s->set_transform( Matrix::translation( 0, 1, 0 ) );
        require_tuple( normal_at( s, Tuple::point( 0, 1.70711, -0.70711 ) ),
                       Tuple::vector( 0, 0.70711, -0.70711 ) );
    }

    SECTION( "transformed" ) {
        real_t half = std::sqrt( 2.0 ) / 2;
        s->set_transform( Matrix::rotation( Z_AXIS, PI / 5 ).scale( 1, 0.5, 1 ) );
        require_tuple( normal_at( s, Tuple::point( 0, half, -half ) ),
                       Tuple::vector( 0, 0.97014, -0.24254 ) );
    }
}

TEST_CASE( "a glass sphere", "[shape][sphere]" )
{
    ShapeArena arena;
    GlassSphere* s = arena.create<GlassSphere>();

    REQUIRE( s->transform() == Matrix::identity( 4 ) );
    REQUIRE( s->material().transparency == Approx( 1.0 ) );
    REQUIRE( s->material().refractive_index == Approx( 1.5 ) );
}

TEST_CASE( "planes", "[shape][plane]" )
{
    ShapeArena arena;
    Plane* p = arena.create<Plane>();

    SECTION( "the normal is constant" ) {
        REQUIRE( normal_at( p, Tuple::point( 0, 0, 0 ) ) == Tuple::vector( 0, 1, 0 ) );
        REQUIRE( normal_at( p, Tuple::point( 10, 0, -10 ) ) == Tuple::vector( 0, 1, 0 ) );
        REQUIRE( normal_at( p, Tuple::point( -5, 0, 150 ) ) == Tuple::vector( 0, 1, 0 ) );
    }

    SECTION( "parallel rays miss" ) {
        REQUIRE( p->intersections( Ray( Tuple::point( 0, 10, 0 ), Tuple::vector( 0, 0, 1 ) ) ).empty() );
    }

    SECTION( "coplanar rays miss" ) {
        REQUIRE( p->intersections( Ray( Tuple::point( 0, 0, 0 ), Tuple::vector( 0, 0, 1 ) ) ).empty() );
    }

    SECTION( "a ray from above" ) {
        IntersectionList xs = p->intersections( Ray( Tuple::point( 0, 1, 0 ), Tuple::vector( 0, -1, 0 ) ) );
        REQUIRE( xs.size() == 1 );
        REQUIRE( xs[0].t == Approx( 1.0 ) );
        REQUIRE( xs[0].object == p );
    }

    SECTION( "a ray from below" ) {
        IntersectionList xs = p->intersections( Ray( Tuple::point( 0, -1, 0 ), Tuple::vector( 0, 1, 0 ) ) );
        REQUIRE( xs.size() == 1 );
        REQUIRE( xs[0].t == Approx( 1.0 ) );
    }

    SECTION( "bounds are infinite in x and z" ) {
        BoundingBox box = p->local_bounds();
        REQUIRE( box.unbounded() );
        REQUIRE( box.lowCoord.x == -INFINITY_REAL );
        REQUIRE( box.highCoord.z == INFINITY_REAL );
        REQUIRE( box.lowCoord.y == 0 );
        REQUIRE( box.highCoord.y == 0 );
    }
}

TEST_CASE( "ray/cube intersection", "[shape][cube]" )
{
    ShapeArena arena;
    Cube* c = arena.create<Cube>();

    SECTION( "hits" ) {
        struct { Tuple origin; Tuple direction; real_t t1; real_t t2; } cases[] = {
            { Tuple::point( 5, 0.5, 0 ), Tuple::vector( -1, 0, 0 ), 4, 6 },
            { Tuple::point( -5, 0.5, 0 ), Tuple::vector( 1, 0, 0 ), 4, 6 },
            { Tuple::point( 0.5, 5, 0 ), Tuple::vector( 0, -1, 0 ), 4, 6 },
            { Tuple::point( 0.5, -5, 0 ), Tuple::vector( 0, 1, 0 ), 4, 6 },
            { Tuple::point( 0.5, 0, 5 ), Tuple::vector( 0, 0, -1 ), 4, 6 },
            { Tuple::point( 0.5, 0, -5 ), Tuple::vector( 0, 0, 1 ), 4, 6 },
            { Tuple::point( 0, 0.5, 0 ), Tuple::vector( 0, 0, 1 ), -1, 1 },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            IntersectionList xs = c->intersections( Ray( cases[i].origin, cases[i].direction ) );
            REQUIRE( xs.size() == 2 );
            REQUIRE( xs[0].t == Approx( cases[i].t1 ) );
            REQUIRE( xs[1].t == Approx( cases[i].t2 ) );
        }
    }

    SECTION( "misses" ) {
        struct { Tuple origin; Tuple direction; } cases[] = {
            { Tuple::point( -2, 0, 0 ), Tuple::vector( 0.2673, 0.5345, 0.8018 ) },
            { Tuple::point( 0, -2, 0 ), Tuple::vector( 0.8018, 0.2673, 0.5345 ) },
            { Tuple::point( 0, 0, -2 ), Tuple::vector( 0.5345, 0.8018, 0.2673 ) },
            { Tuple::point( 2, 0, 2 ), Tuple::vector( 0, 0, -1 ) },
            { Tuple::point( 0, 2, 2 ), Tuple::vector( 0, -1, 0 ) },
            { Tuple::point( 2, 2, 0 ), Tuple::vector( -1, 0, 0 ) },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            REQUIRE( c->intersections( Ray( cases[i].origin, cases[i].direction ) ).empty() );
        }
    }

    SECTION( "normals" ) {
        struct { Tuple point; Tuple normal; } cases[] = {
            { Tuple::point( 1, 0.5, -0.8 ), Tuple::vector( 1, 0, 0 ) },
            { Tuple::point( -1, -0.2, 0.9 ), Tuple::vector( -1, 0, 0 ) },
            { Tuple::point( -0.4, 1, -0.1 ), Tuple::vector( 0, 1, 0 ) },
            { Tuple::point( 0.3, -1, -0.7 ), Tuple::vector( 0, -1, 0 ) },
            { Tuple::point( -0.6, 0.3, 1 ), Tuple::vector( 0, 0, 1 ) },
            { Tuple::point( 0.4, 0.4, -1 ), Tuple::vector( 0, 0, -1 ) },
            { Tuple::point( 1, 1, 1 ), Tuple::vector( 1, 0, 0 ) },
            { Tuple::point( -1, -1, -1 ), Tuple::vector( -1, 0, 0 ) },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            REQUIRE( normal_at( c, cases[i].point ) == cases[i].normal );
        }
    }
}

TEST_CASE( "ray/cylinder intersection", "[shape][cylinder]" )
{
    ShapeArena arena;

    SECTION( "misses" ) {
        Cylinder* cyl = arena.create<Cylinder>();
        struct { Tuple origin; Tuple direction; } cases[] = {
            { Tuple::point( 1, 0, 0 ), Tuple::vector( 0, 1, 0 ) },
            { Tuple::point( 0, 0, 0 ), Tuple::vector( 0, 1, 0 ) },
            { Tuple::point( 0, 0, -5 ), Tuple::vector( 1, 1, 1 ) },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            Ray r( cases[i].origin, normalize( cases[i].direction ) );
            REQUIRE( cyl->intersections( r ).empty() );
        }
    }

    SECTION( "hits" ) {
        Cylinder* cyl = arena.create<Cylinder>();
        struct { Tuple origin; Tuple direction; real_t t0; real_t t1; } cases[] = {
            { Tuple::point( 1, 0, -5 ), Tuple::vector( 0, 0, 1 ), 5, 5 },
            { Tuple::point( 0, 0, -5 ), Tuple::vector( 0, 0, 1 ), 4, 6 },
            { Tuple::point( 0.5, 0, -5 ), Tuple::vector( 0.1, 1, 1 ), 6.80798, 7.08872 },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            Ray r( cases[i].origin, normalize( cases[i].direction ) );
            IntersectionList xs = cyl->intersections( r );
            REQUIRE( xs.size() == 2 );
            REQUIRE( xs[0].t == Approx( cases[i].t0 ).margin( 1e-4 ) );
            REQUIRE( xs[1].t == Approx( cases[i].t1 ).margin( 1e-4 ) );
        }
    }

    SECTION( "side normals" ) {
        Cylinder* cyl = arena.create<Cylinder>();
        REQUIRE( normal_at( cyl, Tuple::point( 1, 0, 0 ) ) == Tuple::vector( 1, 0, 0 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0, 5, -1 ) ) == Tuple::vector( 0, 0, -1 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0, -2, 1 ) ) == Tuple::vector( 0, 0, 1 ) );
        REQUIRE( normal_at( cyl, Tuple::point( -1, 1, 0 ) ) == Tuple::vector( -1, 0, 0 ) );
    }

    SECTION( "the default cylinder is infinite and open" ) {
        Cylinder* cyl = arena.create<Cylinder>();
        REQUIRE( cyl->minimum == -INFINITY_REAL );
        REQUIRE( cyl->maximum == INFINITY_REAL );
        REQUIRE_FALSE( cyl->closed );
        REQUIRE( cyl->bounds().unbounded() );
    }

    SECTION( "a truncated cylinder excludes its ends" ) {
        Cylinder* cyl = arena.create<Cylinder>( 1.0, 2.0, false );
        struct { Tuple origin; Tuple direction; size_t count; } cases[] = {
            { Tuple::point( 0, 1.5, 0 ), Tuple::vector( 0.1, 1, 0 ), 0 },
            { Tuple::point( 0, 3, -5 ), Tuple::vector( 0, 0, 1 ), 0 },
            { Tuple::point( 0, 0, -5 ), Tuple::vector( 0, 0, 1 ), 0 },
            { Tuple::point( 0, 2, -5 ), Tuple::vector( 0, 0, 1 ), 0 },
            { Tuple::point( 0, 1, -5 ), Tuple::vector( 0, 0, 1 ), 0 },
            { Tuple::point( 0, 1.5, -2 ), Tuple::vector( 0, 0, 1 ), 2 },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            Ray r( cases[i].origin, normalize( cases[i].direction ) );
            REQUIRE( cyl->intersections( r ).size() == cases[i].count );
        }

        BoundingBox box = cyl->bounds();
        REQUIRE( box.lowCoord == Tuple::point( -1, 1, -1 ) );
        REQUIRE( box.highCoord == Tuple::point( 1, 2, 1 ) );
    }

    SECTION( "the caps of a closed cylinder" ) {
        Cylinder* cyl = arena.create<Cylinder>( 1.0, 2.0, true );
        struct { Tuple origin; Tuple direction; size_t count; } cases[] = {
            { Tuple::point( 0, 3, 0 ), Tuple::vector( 0, -1, 0 ), 2 },
            { Tuple::point( 0, 3, -2 ), Tuple::vector( 0, -1, 2 ), 2 },
            { Tuple::point( 0, 0, -2 ), Tuple::vector( 0, 1, 2 ), 2 },
        };

        for ( size_t i = 0; i < sizeof cases / sizeof cases[0]; i++ ) {
            INFO( "case " << i );
            Ray r( cases[i].origin, normalize( cases[i].direction ) );
            REQUIRE( cyl->intersections( r ).size() == cases[i].count );
        }
    }

    SECTION( "cap normals" ) {
        Cylinder* cyl = arena.create<Cylinder>( 1.0, 2.0, true );
        REQUIRE( normal_at( cyl, Tuple::point( 0, 1, 0 ) ) == Tuple::vector( 0, -1, 0 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0.5, 1, 0 ) ) == Tuple::vector( 0, -1, 0 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0, 1, 0.5 ) ) == Tuple::vector( 0, -1, 0 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0, 2, 0 ) ) == Tuple::vector( 0, 1, 0 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0.5, 2, 0 ) ) == Tuple::vector( 0, 1, 0 ) );
        REQUIRE( normal_at( cyl, Tuple::point( 0, 2, 0.5 ) ) == Tuple::vector( 0, 1, 0 ) );
    }
}

TEST_CASE( "triangles", "[shape][triangle]" )
{
    ShapeArena arena;
    Tuple p1 = Tuple::point( 0, 1, 0 );
    Tuple p2 = Tuple::point( -1, 0, 0 );
    Tuple p3 = Tuple::point( 1, 0, 0 );
    Triangle* tri = arena.create<Triangle>( p1, p2, p3 );

    SECTION( "construction" ) {
        REQUIRE( tri->p1 == p1 );
        REQUIRE( tri->p2 == p2 );
        REQUIRE( tri->p3 == p3 );
        REQUIRE( tri->e1 == Tuple::vector( -1, -1, 0 ) );
        REQUIRE( tri->e2 == Tuple::vector( 1, -1, 0 ) );
        REQUIRE( tri->face_normal == Tuple::vector( 0, 0, -1 ) );
    }

    SECTION( "the normal is the face normal everywhere" ) {
        REQUIRE( normal_at( tri, Tuple::point( 0, 0.5, 0 ) ) == tri->face_normal );
        REQUIRE( normal_at( tri, Tuple::point( -0.5, 0.75, 0 ) ) == tri->face_normal );
        REQUIRE( normal_at( tri, Tuple::point( 0.5, 0.25, 0 ) ) == tri->face_normal );
    }

    SECTION( "a parallel ray misses" ) {
        REQUIRE( tri->intersections( Ray( Tuple::point( 0, -1, -2 ), Tuple::vector( 0, 1, 0 ) ) ).empty() );
    }

    SECTION( "rays past each edge miss" ) {
        REQUIRE( tri->intersections( Ray( Tuple::point( 1, 1, -2 ), Tuple::vector( 0, 0, 1 ) ) ).empty() );
        REQUIRE( tri->intersections( Ray( Tuple::point( -1, 1, -2 ), Tuple::vector( 0, 0, 1 ) ) ).empty() );
        REQUIRE( tri->intersections( Ray( Tuple::point( 0, -1, -2 ), Tuple::vector( 0, 0, 1 ) ) ).empty() );
    }

    SECTION( "a ray strikes the triangle" ) {
        IntersectionList xs = tri->intersections( Ray( Tuple::point( 0, 0.5, -2 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 1 );
        REQUIRE( xs[0].t == Approx( 2.0 ) );
        REQUIRE( xs[0].object == tri );
    }

    SECTION( "bounds enclose the vertices" ) {
        BoundingBox box = tri->bounds();
        REQUIRE( box.lowCoord == Tuple::point( -1, 0, 0 ) );
        REQUIRE( box.highCoord == Tuple::point( 1, 1, 0 ) );
    }
}

TEST_CASE( "smooth triangles", "[shape][triangle]" )
{
    ShapeArena arena;
    SmoothTriangle* tri = arena.create<SmoothTriangle>(
        Tuple::point( 0, 1, 0 ), Tuple::point( -1, 0, 0 ), Tuple::point( 1, 0, 0 ),
        Tuple::vector( 0, 1, 0 ), Tuple::vector( -1, 0, 0 ), Tuple::vector( 1, 0, 0 ) );

    SECTION( "an intersection stores u and v" ) {
        IntersectionList xs = tri->intersections( Ray( Tuple::point( -0.2, 0.3, -2 ), Tuple::vector( 0, 0, 1 ) ) );
        REQUIRE( xs.size() == 1 );
        REQUIRE( xs[0].has_uv );
        REQUIRE( xs[0].u == Approx( 0.45 ) );
        REQUIRE( xs[0].v == Approx( 0.25 ) );
    }

    SECTION( "the normal is interpolated" ) {
        Intersection i( 1, tri, 0.45, 0.25 );
        require_tuple( tri->normal( Tuple::point( 0, 0, 0 ), i ),
                       Tuple::vector( -0.5547, 0.83205, 0 ) );
    }

    SECTION( "the interpolated normal is used for shading" ) {
        Intersection i( 1, tri, 0.45, 0.25 );
        Ray r( Tuple::point( -0.2, 0.3, -2 ), Tuple::vector( 0, 0, 1 ) );
        IntersectionState comps = prepare_computations( i, r );
        require_tuple( comps.normalv, Tuple::vector( -0.5547, 0.83205, 0 ) );
    }
}
