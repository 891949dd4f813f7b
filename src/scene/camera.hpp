/**
 * @file camera.hpp
 * @brief A pinhole camera that renders a world row by row.
 */

#ifndef _LUMEN_SCENE_CAMERA_HPP_
#define _LUMEN_SCENE_CAMERA_HPP_

#include "math/matrix.hpp"
#include "scene/ray.hpp"
#include "image/canvas.hpp"

namespace lumen {

class World;

/**
 * The camera looks down -z in its own space, toward a canvas one unit away.
 * The transform maps world space to camera space, usually built with
 * Matrix::view_transform.
 */
class Camera
{
public:

    Camera();
    Camera( size_t hsize, size_t vsize, real_t field_of_view );

    size_t hsize() const { return horizontal; }
    size_t vsize() const { return vertical; }
    real_t field_of_view() const { return fov; }
    real_t pixel_size() const { return pixel; }
    real_t half_width() const { return half_w; }
    real_t half_height() const { return half_h; }

    // changing the size keeps the field of view
    void set_size( size_t hsize, size_t vsize );

    const Matrix& transform() const { return transform_; }
    // throws std::domain_error if mat is not invertible
    void set_transform( const Matrix& mat );

    // print the image size, periodic progress and the total time
    bool report_progress;

    // the ray through the center of pixel (px, py)
    Ray ray_for_pixel( size_t px, size_t py ) const;

    /**
     * Renders every pixel with World::color_at and MAX_REFLECTIONS bounces.
     * Rows are spread over OpenMP threads.
     */
    Canvas render( const World& world ) const;

private:

    void compute_pixel_size();

    size_t horizontal, vertical;
    real_t fov;
    real_t pixel, half_w, half_h;
    Matrix transform_;
};

} /* lumen */

#endif /* _LUMEN_SCENE_CAMERA_HPP_ */
