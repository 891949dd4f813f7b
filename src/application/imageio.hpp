/**
 * @file imageio.hpp
 * @brief Writing rendered canvases to disk as plain PPM.
 */

#ifndef _LUMEN_APPLICATION_IMAGEIO_HPP_
#define _LUMEN_APPLICATION_IMAGEIO_HPP_

#include "image/canvas.hpp"
#include <iosfwd>

namespace lumen {

// no line of a plain PPM file may be longer than this
#define PPM_MAX_LINE_LENGTH 70

/**
 * Writes the canvas as a plain (P3) PPM with a maximum value of 255. Each row
 * of pixels starts on a new line; longer rows wrap at the last space before
 * PPM_MAX_LINE_LENGTH. The output ends with a newline.
 */
void ppm_encode( const Canvas& canvas, std::ostream& out );

/**
 * Saves the canvas to filename as PPM.
 * @return true on success, false (with a message printed) on error.
 */
bool imageio_save_image( const char* filename, const Canvas& canvas );

} /* lumen */

#endif /* _LUMEN_APPLICATION_IMAGEIO_HPP_ */
