/**
 * @file canvas.hpp
 * @brief The grid of colors a render writes into.
 */

#ifndef _LUMEN_IMAGE_CANVAS_HPP_
#define _LUMEN_IMAGE_CANVAS_HPP_

#include "math/color.hpp"
#include <vector>

namespace lumen {

/**
 * A width x height grid of colors, row-major, with (0, 0) at the top left.
 * Every pixel starts black.
 */
class Canvas
{
public:

    typedef std::vector<Color3> PixelRow;

    Canvas();
    Canvas( size_t width, size_t height );

    /**
     * Builds a canvas from rendered rows. Throws std::invalid_argument unless
     * there are exactly height rows of exactly width pixels.
     */
    Canvas( const std::vector<PixelRow>& rows, size_t width, size_t height );

    size_t width() const { return w; }
    size_t height() const { return h; }

    // out of range coordinates throw std::out_of_range
    void write_pixel( size_t x, size_t y, const Color3& color );
    const Color3& pixel_at( size_t x, size_t y ) const;

    /**
     * Writes the image as 8-bit RGB into buffer, which must have room for
     * width * height * 3 bytes.
     */
    void output( unsigned char* buffer ) const;

private:

    size_t offset( size_t x, size_t y ) const;

    size_t w, h;
    std::vector<Color3> colors;
};

} /* lumen */

#endif /* _LUMEN_IMAGE_CANVAS_HPP_ */
