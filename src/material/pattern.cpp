#include "material/pattern.hpp"

namespace lumen {

static bool is_even( real_t value )
{
    return std::fmod( std::fabs( value ), 2.0 ) < 0.5;
}

Color3 PatternPen::color_at( const Tuple& pattern_point ) const
{
    if ( pattern )
        return pattern->color_at( pattern_point );
    return color;
}

Pattern::Pattern( const PatternPen& a, const PatternPen& b )
    : transform( Matrix::identity( 4 ) ), a( a ), b( b ) { }

Pattern::~Pattern() { }

Color3 Pattern::color_at( const Tuple& object_point ) const
{
    return local_color_at( transform.inverse() * object_point );
}

StripePattern::StripePattern( const PatternPen& a, const PatternPen& b )
    : Pattern( a, b ) { }

Color3 StripePattern::local_color_at( const Tuple& p ) const
{
    return is_even( denoised_floor( p.x ) ) ? a.color_at( p ) : b.color_at( p );
}

GradientPattern::GradientPattern( const PatternPen& a, const PatternPen& b )
    : Pattern( a, b ) { }

Color3 GradientPattern::local_color_at( const Tuple& p ) const
{
    Color3 from = a.color_at( p );
    Color3 to = b.color_at( p );
    real_t fraction = p.x - std::floor( p.x );

    return from + ( to - from ) * fraction;
}

RingPattern::RingPattern( const PatternPen& a, const PatternPen& b )
    : Pattern( a, b ) { }

Color3 RingPattern::local_color_at( const Tuple& p ) const
{
    real_t distance = std::sqrt( p.x * p.x + p.z * p.z );
    return is_even( denoised_floor( distance ) ) ? a.color_at( p ) : b.color_at( p );
}

CheckersPattern::CheckersPattern( const PatternPen& a, const PatternPen& b )
    : Pattern( a, b ) { }

Color3 CheckersPattern::local_color_at( const Tuple& p ) const
{
    real_t sum = denoised_floor( p.x ) + denoised_floor( p.y ) + denoised_floor( p.z );
    return is_even( sum ) ? a.color_at( p ) : b.color_at( p );
}

} /* lumen */
