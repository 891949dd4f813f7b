#include "image/canvas.hpp"

#include <sstream>
#include <stdexcept>

namespace lumen {

Canvas::Canvas() : w( 0 ), h( 0 ) { }

Canvas::Canvas( size_t width, size_t height )
    : w( width ), h( height ), colors( width * height, Color3::Black() ) { }

Canvas::Canvas( const std::vector<PixelRow>& rows, size_t width, size_t height )
    : w( width ), h( height )
{
    if ( rows.size() != height ) {
        std::ostringstream msg;
        msg << "canvas expects " << height << " rows, got " << rows.size();
        throw std::invalid_argument( msg.str() );
    }

    colors.reserve( width * height );
    for ( size_t y = 0; y < height; y++ ) {
        if ( rows[y].size() != width ) {
            std::ostringstream msg;
            msg << "canvas row " << y << " has " << rows[y].size()
                << " pixels, expected " << width;
            throw std::invalid_argument( msg.str() );
        }
        colors.insert( colors.end(), rows[y].begin(), rows[y].end() );
    }
}

size_t Canvas::offset( size_t x, size_t y ) const
{
    if ( x >= w || y >= h ) {
        std::ostringstream msg;
        msg << "pixel (" << x << ", " << y << ") outside of " << w << "x" << h << " canvas";
        throw std::out_of_range( msg.str() );
    }
    return y * w + x;
}

void Canvas::write_pixel( size_t x, size_t y, const Color3& color )
{
    colors[offset( x, y )] = color;
}

const Color3& Canvas::pixel_at( size_t x, size_t y ) const
{
    return colors[offset( x, y )];
}

void Canvas::output( unsigned char* buffer ) const
{
    for ( size_t i = 0; i < colors.size(); i++ )
        colors[i].to_array( &buffer[3 * i] );
}

} /* lumen */
