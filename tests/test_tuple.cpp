#include "math/tuple.hpp"

#include <catch2/catch.hpp>

using namespace lumen;

TEST_CASE( "points and vectors are told apart by w", "[tuple]" )
{
    Tuple a( 4.3, -4.2, 3.1, 1.0 );
    REQUIRE( a.is_point() );
    REQUIRE_FALSE( a.is_vector() );

    Tuple b( 4.3, -4.2, 3.1, 0.0 );
    REQUIRE( b.is_vector() );
    REQUIRE_FALSE( b.is_point() );

    REQUIRE( Tuple::point( 4, -4, 3 ) == Tuple( 4, -4, 3, 1 ) );
    REQUIRE( Tuple::vector( 4, -4, 3 ) == Tuple( 4, -4, 3, 0 ) );
}

TEST_CASE( "components by index", "[tuple]" )
{
    Tuple a( 4.3, -4.2, 3.1, 1.0 );
    REQUIRE( a[0] == 4.3 );
    REQUIRE( a[1] == -4.2 );
    REQUIRE( a[2] == 3.1 );
    REQUIRE( a[3] == 1.0 );

    a[1] = 7;
    a[3] = 0;
    REQUIRE( a == Tuple::vector( 4.3, 7, 3.1 ) );

    REQUIRE_THROWS_AS( a[4], std::out_of_range );
}

TEST_CASE( "tuple arithmetic", "[tuple]" )
{
    SECTION( "adding a vector to a point gives a point" ) {
        Tuple sum = Tuple( 3, -2, 5, 1 ) + Tuple( -2, 3, 1, 0 );
        REQUIRE( sum == Tuple( 1, 1, 6, 1 ) );
    }

    SECTION( "subtracting two points gives a vector" ) {
        REQUIRE( Tuple::point( 3, 2, 1 ) - Tuple::point( 5, 6, 7 ) == Tuple::vector( -2, -4, -6 ) );
    }

    SECTION( "subtracting a vector from a point gives a point" ) {
        REQUIRE( Tuple::point( 3, 2, 1 ) - Tuple::vector( 5, 6, 7 ) == Tuple::point( -2, -4, -6 ) );
    }

    SECTION( "negation" ) {
        REQUIRE( -Tuple( 1, -2, 3, -4 ) == Tuple( -1, 2, -3, 4 ) );
    }

    SECTION( "scalar multiplication and division" ) {
        Tuple a( 1, -2, 3, -4 );
        REQUIRE( a * 3.5 == Tuple( 3.5, -7, 10.5, -14 ) );
        REQUIRE( a * 0.5 == Tuple( 0.5, -1, 1.5, -2 ) );
        REQUIRE( 2.0 * a == Tuple( 2, -4, 6, -8 ) );
        REQUIRE( a / 2 == Tuple( 0.5, -1, 1.5, -2 ) );
    }

    SECTION( "compound assignment" ) {
        Tuple a = Tuple::point( 1, 2, 3 );
        a += Tuple::vector( 1, 1, 1 );
        REQUIRE( a == Tuple::point( 2, 3, 4 ) );
        a -= Tuple::vector( 2, 3, 4 );
        REQUIRE( a == Tuple::Origin() );
    }
}

TEST_CASE( "approximate equality", "[tuple]" )
{
    REQUIRE( Tuple::point( 1, 2, 3 ) == Tuple::point( 1 + EPSILON / 2, 2, 3 ) );
    REQUIRE( Tuple::point( 1, 2, 3 ) != Tuple::point( 1 + EPSILON * 2, 2, 3 ) );
    REQUIRE( Tuple::point( 1, 2, 3 ) != Tuple::vector( 1, 2, 3 ) );
}

TEST_CASE( "magnitude and normalization", "[tuple]" )
{
    REQUIRE( magnitude( Tuple::vector( 1, 0, 0 ) ) == Approx( 1 ) );
    REQUIRE( magnitude( Tuple::vector( 0, 0, 1 ) ) == Approx( 1 ) );
    REQUIRE( magnitude( Tuple::vector( 1, 2, 3 ) ) == Approx( std::sqrt( 14.0 ) ) );
    REQUIRE( magnitude( Tuple::vector( -1, -2, -3 ) ) == Approx( std::sqrt( 14.0 ) ) );

    REQUIRE( normalize( Tuple::vector( 4, 0, 0 ) ) == Tuple::vector( 1, 0, 0 ) );

    Tuple n = normalize( Tuple::vector( 1, 2, 3 ) );
    real_t len = std::sqrt( 14.0 );
    REQUIRE( n == Tuple::vector( 1 / len, 2 / len, 3 / len ) );
    REQUIRE( magnitude( n ) == Approx( 1 ) );
}

TEST_CASE( "dot and cross products", "[tuple]" )
{
    Tuple a = Tuple::vector( 1, 2, 3 );
    Tuple b = Tuple::vector( 2, 3, 4 );

    REQUIRE( dot( a, b ) == Approx( 20 ) );
    REQUIRE( cross( a, b ) == Tuple::vector( -1, 2, -1 ) );
    REQUIRE( cross( b, a ) == Tuple::vector( 1, -2, 1 ) );
    REQUIRE( cross( Tuple::vector( 1, 0, 0 ), Tuple::vector( 0, 1, 0 ) ) == Tuple::vector( 0, 0, 1 ) );
}

TEST_CASE( "reflecting a vector", "[tuple]" )
{
    SECTION( "approaching at 45 degrees" ) {
        Tuple r = reflect( Tuple::vector( 1, -1, 0 ), Tuple::vector( 0, 1, 0 ) );
        REQUIRE( r == Tuple::vector( 1, 1, 0 ) );
    }

    SECTION( "off a slanted surface" ) {
        real_t h = std::sqrt( 2.0 ) / 2;
        Tuple r = reflect( Tuple::vector( 0, -1, 0 ), Tuple::vector( h, h, 0 ) );
        REQUIRE( r == Tuple::vector( 1, 0, 0 ) );
    }
}
