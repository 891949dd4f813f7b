/**
 * @file main.cpp
 * @brief Command line front end: loads a scene, renders it and saves a PPM.
 */

#include "application/imageio.hpp"
#include "application/scene_loader.hpp"
#include "scene/scene.hpp"

#include <SDL.h>
#include <omp.h>

#include <cstdio>
#include <cstring>
#include <iostream>

namespace lumen {

#define DEFAULT_OUTPUT "out.ppm"

struct Options
{
    const char* input_filename;
    const char* output_filename;
    // 0 keeps the size from the scene file
    int width, height;
    // 0 lets OpenMP decide
    int num_threads;
    bool quiet;
};

static void print_usage( const char* progname )
{
    std::cout << "Usage: " << progname
        << " [-d width height] [-t threads] [-q] input_scene [output_file]\n"
        << "\n"
        << "Options:\n"
        << "\n"
        << "\t-d:\n"
        << "\t\tRender at the given size instead of the camera's.\n"
        << "\t-t:\n"
        << "\t\tNumber of render threads.\n"
        << "\t-q:\n"
        << "\t\tDon't print render progress.\n"
        << "\tinput_scene:\n"
        << "\t\tThe scene file to load and raytrace.\n"
        << "\toutput_file:\n"
        << "\t\tThe PPM file to write, " DEFAULT_OUTPUT " if omitted.\n"
        << "\n";
}

static bool parse_args( Options* opt, int argc, char* argv[] )
{
    int index = 1;

    opt->width = 0;
    opt->height = 0;
    opt->num_threads = 0;
    opt->quiet = false;
    opt->input_filename = 0;
    opt->output_filename = DEFAULT_OUTPUT;

    while ( index < argc && argv[index][0] == '-' ) {
        if ( strcmp( argv[index], "-d" ) == 0 ) {
            if ( argc <= index + 2 ) {
                print_usage( argv[0] );
                return false;
            }

            // parse image dimensions
            opt->width = -1;
            opt->height = -1;
            sscanf( argv[index + 1], "%d", &opt->width );
            sscanf( argv[index + 2], "%d", &opt->height );
            // check for valid width/height
            if ( opt->width < 1 || opt->height < 1 ) {
                std::cout << "Invalid image dimensions\n";
                return false;
            }
            index += 3;
        } else if ( strcmp( argv[index], "-t" ) == 0 ) {
            if ( argc <= index + 1 ) {
                print_usage( argv[0] );
                return false;
            }

            opt->num_threads = -1;
            sscanf( argv[index + 1], "%d", &opt->num_threads );
            if ( opt->num_threads < 1 ) {
                std::cout << "Invalid thread count\n";
                return false;
            }
            index += 2;
        } else if ( strcmp( argv[index], "-q" ) == 0 ) {
            opt->quiet = true;
            index++;
        } else {
            std::cout << "Unknown option '" << argv[index] << "'.\n";
            print_usage( argv[0] );
            return false;
        }
    }

    if ( index >= argc ) {
        print_usage( argv[0] );
        return false;
    }

    opt->input_filename = argv[index];

    if ( argc > index + 1 )
        opt->output_filename = argv[index + 1];

    if ( argc > index + 2 ) {
        std::cout << "Too many arguments.\n";
        return false;
    }

    return true;
}

static int run( const Options& opt )
{
    Scene scene;

    // load the given scene
    if ( !load_scene( &scene, opt.input_filename ) ) {
        std::cout << "Error loading scene " << opt.input_filename << ". Aborting.\n";
        return 1;
    }

    if ( opt.width > 0 )
        scene.camera.set_size( opt.width, opt.height );
    if ( opt.num_threads > 0 )
        omp_set_num_threads( opt.num_threads );
    scene.camera.report_progress = !opt.quiet;

    Uint32 start = SDL_GetTicks();
    Canvas image = scene.render();
    Uint32 end = SDL_GetTicks();

    if ( !imageio_save_image( opt.output_filename, image ) ) {
        std::cout << "Error saving raytraced image to '" << opt.output_filename << "'.\n";
        return 1;
    }

    std::cout << "Saved raytraced image to '" << opt.output_filename << "' ("
        << ( end - start ) << " ms).\n";
    return 0;
}

} /* lumen */

using namespace lumen;

int main( int argc, char* argv[] )
{
    Options opt;

    if ( !parse_args( &opt, argc, argv ) ) {
        return 1;
    }

    if ( SDL_Init( SDL_INIT_TIMER ) != 0 ) {
        std::cout << "Error initializing SDL: " << SDL_GetError() << "\n";
        return 1;
    }

    int rv = run( opt );

    SDL_Quit();
    return rv;
}
