/**
 * @file world.cpp
 * @brief Whitted-style shading: Phong lighting, shadows, reflection and
 *  refraction.
 */

#include "scene/world.hpp"

namespace lumen {

World::World() { }

World::~World() { }

void World::add_object( Shape* shape )
{
    shape->refresh_bounds();
    shapes.push_back( shape );
}

void World::reset()
{
    shapes.clear();
    light = PointLight();
}

IntersectionList World::intersections( const Ray& r ) const
{
    IntersectionList xs;
    for ( size_t i = 0; i < shapes.size(); i++ ) {
        IntersectionList shape_xs = shapes[i]->intersections( r );
        xs.insert( xs.end(), shape_xs.begin(), shape_xs.end() );
    }
    sort_intersections( xs );
    return xs;
}

Color3 World::shade_hit( const IntersectionState& comps, int remaining ) const
{
    bool shadowed = is_shadowed( comps.over_point );
    Color3 surface = comps.object->lighting( light, comps.over_point,
                                             comps.eyev, comps.normalv, shadowed );

    Color3 reflected = reflected_color( comps, remaining );
    Color3 refracted = refracted_color( comps, remaining );

    const Material& mat = comps.object->material();
    if ( mat.reflective > 0 && mat.transparency > 0 ) {
        real_t reflectance = schlick( comps );
        return surface + reflected * reflectance + refracted * ( 1 - reflectance );
    }

    return surface + reflected + refracted;
}

Color3 World::shade_hit( const Intersection& hit, const Ray& r,
                         const IntersectionList& xs, int remaining ) const
{
    return shade_hit( prepare_computations( hit, r, xs ), remaining );
}

Color3 World::color_at( const Ray& r, int remaining ) const
{
    IntersectionList xs = intersections( r );

    const Intersection* hit = find_hit( xs );
    if ( !hit )
        return Color3::Black();

    return shade_hit( *hit, r, xs, remaining );
}

Color3 World::reflected_color( const IntersectionState& comps, int remaining ) const
{
    real_t reflective = comps.object->material().reflective;
    if ( remaining <= 0 || reflective == 0 )
        return Color3::Black();

    Ray reflect_ray( comps.over_point, comps.reflectv );
    return color_at( reflect_ray, remaining - 1 ) * reflective;
}

Color3 World::refracted_color( const IntersectionState& comps, int remaining ) const
{
    real_t transparency = comps.object->material().transparency;
    if ( remaining <= 0 || transparency == 0 )
        return Color3::Black();

    // Snell's law
    real_t n_ratio = comps.n1 / comps.n2;
    real_t cos_i = dot( comps.eyev, comps.normalv );
    real_t sin2_t = n_ratio * n_ratio * ( 1 - cos_i * cos_i );

    // total internal reflection
    if ( sin2_t > 1 )
        return Color3::Black();

    real_t cos_t = std::sqrt( 1.0 - sin2_t );
    Tuple direction = comps.normalv * ( n_ratio * cos_i - cos_t ) - comps.eyev * n_ratio;

    Ray refract_ray( comps.under_point, direction );
    return color_at( refract_ray, remaining - 1 ) * transparency;
}

bool World::is_shadowed( const Tuple& point ) const
{
    Tuple to_light = light.position - point;
    real_t distance = magnitude( to_light );
    Ray shadow_ray( point, normalize( to_light ) );

    for ( size_t i = 0; i < shapes.size(); i++ ) {
        if ( !shapes[i]->casts_shadow )
            continue;

        IntersectionList xs = shapes[i]->intersections( shadow_ray );
        for ( size_t j = 0; j < xs.size(); j++ ) {
            if ( xs[j].t > 0 && xs[j].t < distance && xs[j].object->casts_shadow )
                return true;
        }
    }
    return false;
}

} /* lumen */
