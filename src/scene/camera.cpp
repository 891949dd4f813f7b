/**
 * @file camera.cpp
 * @brief Primary rays and the parallel render loop.
 */

#include "scene/camera.hpp"
#include "scene/world.hpp"

#include <cstdio>
#include <stdexcept>
#include <omp.h>
#include <SDL_timer.h>

namespace lumen {

// milliseconds between two progress lines
#define PROGRESS_INTERVAL 5000

Camera::Camera()
    : report_progress( false ), horizontal( 160 ), vertical( 120 ), fov( PI / 3 )
{
    compute_pixel_size();
}

Camera::Camera( size_t hsize, size_t vsize, real_t field_of_view )
    : report_progress( false ), horizontal( hsize ), vertical( vsize ), fov( field_of_view )
{
    compute_pixel_size();
}

void Camera::set_size( size_t hsize, size_t vsize )
{
    horizontal = hsize;
    vertical = vsize;
    compute_pixel_size();
}

void Camera::set_transform( const Matrix& mat )
{
    if ( !mat.invertible() )
        throw std::domain_error( "camera transform is not invertible" );
    transform_ = mat;
}

void Camera::compute_pixel_size()
{
    // the larger dimension spans the field of view, so no aspect ratio distorts the image
    real_t view_units = std::tan( fov / 2 ) * 2;
    real_t max_dimension = (real_t) std::max( horizontal, vertical );

    pixel = view_units / max_dimension;
    half_w = horizontal * pixel / 2;
    half_h = vertical * pixel / 2;
}

Ray Camera::ray_for_pixel( size_t px, size_t py ) const
{
    // offset from the canvas edge to the pixel's center
    real_t x_offset = ( px + 0.5 ) * pixel;
    real_t y_offset = ( py + 0.5 ) * pixel;

    // the camera looks toward -z, so +x is to the left
    real_t world_x = half_w - x_offset;
    real_t world_y = half_h - y_offset;

    Matrix inverse = transform_.inverse();
    Tuple target = inverse * Tuple::point( world_x, world_y, -1 );
    Tuple origin = inverse * Tuple::Origin();

    return Ray( origin, normalize( target - origin ) );
}

Canvas Camera::render( const World& world ) const
{
    Canvas image( horizontal, vertical );
    int height = (int) vertical;
    int rows_done = 0;

    Uint32 start_time = SDL_GetTicks();
    Uint32 prev_time = start_time;

    if ( report_progress )
        printf( "Rendering %lux%lu\n", (unsigned long) horizontal, (unsigned long) vertical );

    // This tells OpenMP that this loop can be parallelized.
#pragma omp parallel for schedule(dynamic)
    for ( int y = 0; y < height; y++ )
    {
        for ( size_t x = 0; x < horizontal; x++ )
        {
            Ray r = ray_for_pixel( x, y );
            Color3 color = world.color_at( r, MAX_REFLECTIONS );

            // the canvas is the only state shared between rows
#pragma omp critical
            image.write_pixel( x, y, color );
        }

        int done;
#pragma omp atomic capture
        done = ++rows_done;

        if ( report_progress && omp_get_thread_num() == 0 ) {
            Uint32 this_time = SDL_GetTicks();
            if ( this_time - prev_time > PROGRESS_INTERVAL ) {
                prev_time = this_time;
                printf( "%.1f%%\n", (float) done / height * 100 );
            }
        }
    }

    if ( report_progress )
        printf( "Done raytracing! %u ms\n", (unsigned) ( SDL_GetTicks() - start_time ) );

    return image;
}

} /* lumen */
