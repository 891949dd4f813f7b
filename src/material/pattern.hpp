/**
 * @file pattern.hpp
 * @brief Procedural color patterns.
 */

#ifndef _LUMEN_MATERIAL_PATTERN_HPP_
#define _LUMEN_MATERIAL_PATTERN_HPP_

#include "math/color.hpp"
#include "math/matrix.hpp"

namespace lumen {

class Pattern;

/**
 * One of the two inputs of a pattern: either a flat color or, when pattern
 * is non-null, a nested pattern evaluated at the same pattern-space point.
 * The nested pattern is not owned.
 */
struct PatternPen
{
    Color3 color;
    const Pattern* pattern;

    PatternPen() : color( Color3::Black() ), pattern( 0 ) { }
    PatternPen( const Color3& c ) : color( c ), pattern( 0 ) { }
    PatternPen( const Pattern* p ) : color( Color3::Black() ), pattern( p ) { }

    Color3 color_at( const Tuple& pattern_point ) const;
};

/**
 * A pattern keyed on object-space coordinates. Patterns have their own
 * transform on top of the object's, so they can be moved independently.
 */
class Pattern
{
public:

    // the pattern transform (pattern space -> object space)
    Matrix transform;

    PatternPen a;
    PatternPen b;

    Pattern( const PatternPen& a, const PatternPen& b );
    virtual ~Pattern();

    // maps the object-space point into pattern space and evaluates it
    Color3 color_at( const Tuple& object_point ) const;

    virtual Color3 local_color_at( const Tuple& pattern_point ) const = 0;
};

// alternates between a and b on every unit of x
class StripePattern : public Pattern
{
public:
    StripePattern( const PatternPen& a = Color3::White(),
                   const PatternPen& b = Color3::Black() );
    virtual Color3 local_color_at( const Tuple& pattern_point ) const;
};

// blends linearly from a to b over every unit of x
class GradientPattern : public Pattern
{
public:
    GradientPattern( const PatternPen& a = Color3::White(),
                     const PatternPen& b = Color3::Black() );
    virtual Color3 local_color_at( const Tuple& pattern_point ) const;
};

// concentric rings around the y axis
class RingPattern : public Pattern
{
public:
    RingPattern( const PatternPen& a = Color3::White(),
                 const PatternPen& b = Color3::Black() );
    virtual Color3 local_color_at( const Tuple& pattern_point ) const;
};

// 3D checkerboard of unit cubes
class CheckersPattern : public Pattern
{
public:
    CheckersPattern( const PatternPen& a = Color3::White(),
                     const PatternPen& b = Color3::Black() );
    virtual Color3 local_color_at( const Tuple& pattern_point ) const;
};

} /* lumen */

#endif /* _LUMEN_MATERIAL_PATTERN_HPP_ */
