#include "application/imageio.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace lumen {

static void append_value( std::string& line, int value, std::ostream& out )
{
    std::ostringstream token;
    token << value;

    if ( !line.empty() && line.size() + 1 + token.str().size() > PPM_MAX_LINE_LENGTH ) {
        out << line << '\n';
        line.clear();
    }

    if ( !line.empty() )
        line += ' ';
    line += token.str();
}

void ppm_encode( const Canvas& canvas, std::ostream& out )
{
    out << "P3\n" << canvas.width() << " " << canvas.height() << "\n255\n";

    // one stream of values, last canvas row first, wrapped only at the line limit
    std::string line;
    for ( size_t row = canvas.height(); row > 0; row-- ) {
        for ( size_t x = 0; x < canvas.width(); x++ ) {
            const Color3& c = canvas.pixel_at( x, row - 1 );
            append_value( line, color_component_byte( c.r ), out );
            append_value( line, color_component_byte( c.g ), out );
            append_value( line, color_component_byte( c.b ), out );
        }
    }
    if ( !line.empty() )
        out << line << '\n';
}

bool imageio_save_image( const char* filename, const Canvas& canvas )
{
    std::ofstream file( filename );
    if ( !file ) {
        std::cout << "Error opening '" << filename << "' for writing.\n";
        return false;
    }

    ppm_encode( canvas, file );
    file.close();

    if ( file.fail() ) {
        std::cout << "Error writing '" << filename << "'.\n";
        return false;
    }
    return true;
}

} /* lumen */
