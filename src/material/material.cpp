#include "material/material.hpp"
#include "material/pattern.hpp"
#include "light/point.hpp"

namespace lumen {

Material::Material()
    : color( Color3::White() ),
      ambient( 0.1 ),
      diffuse( 0.9 ),
      specular( 0.9 ),
      shininess( 200.0 ),
      reflective( 0.0 ),
      transparency( 0.0 ),
      refractive_index( REFRACTIVE_INDEX_VACUUM ),
      pattern( 0 ) { }

Color3 Material::color_at( const Tuple& object_point ) const
{
    if ( pattern )
        return pattern->color_at( object_point );
    return color;
}

Color3 Material::lighting( const PointLight& light,
                           const Tuple& object_point,
                           const Tuple& world_point,
                           const Tuple& eyev,
                           const Tuple& normalv,
                           bool in_shadow ) const
{
    Color3 effective_color = color_at( object_point ) * light.intensity;
    Color3 ambient_color = effective_color * ambient;

    if ( in_shadow )
        return ambient_color;

    Tuple lightv = normalize( light.position - world_point );

    // negative means the light is on the other side of the surface
    real_t light_dot_normal = dot( lightv, normalv );
    if ( light_dot_normal < 0 )
        return ambient_color;

    Color3 diffuse_color = effective_color * diffuse * light_dot_normal;
    Color3 specular_color = Color3::Black();

    // negative means the light reflects away from the eye
    Tuple reflectv = reflect( -lightv, normalv );
    real_t reflect_dot_eye = dot( reflectv, eyev );
    if ( reflect_dot_eye > 0 ) {
        real_t factor = std::pow( reflect_dot_eye, shininess );
        specular_color = light.intensity * specular * factor;
    }

    return ambient_color + diffuse_color + specular_color;
}

bool operator==( const Material& lhs, const Material& rhs )
{
    return lhs.color == rhs.color &&
           approx_equal( lhs.ambient, rhs.ambient ) &&
           approx_equal( lhs.diffuse, rhs.diffuse ) &&
           approx_equal( lhs.specular, rhs.specular ) &&
           approx_equal( lhs.shininess, rhs.shininess ) &&
           approx_equal( lhs.reflective, rhs.reflective ) &&
           approx_equal( lhs.transparency, rhs.transparency ) &&
           approx_equal( lhs.refractive_index, rhs.refractive_index ) &&
           lhs.pattern == rhs.pattern;
}

} /* lumen */
