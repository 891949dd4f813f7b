/**
 * @file intersection.cpp
 * @brief Hit selection and the shading state of a hit.
 */

#include "scene/intersection.hpp"
#include "scene/shape.hpp"

#include <algorithm>

namespace lumen {

bool operator<( const Intersection& lhs, const Intersection& rhs )
{
    return lhs.t < rhs.t;
}

bool operator==( const Intersection& lhs, const Intersection& rhs )
{
    return lhs.object == rhs.object && approx_equal( lhs.t, rhs.t );
}

void sort_intersections( IntersectionList& xs )
{
    std::stable_sort( xs.begin(), xs.end() );
}

const Intersection* find_hit( const IntersectionList& xs )
{
    const Intersection* best = 0;
    for ( size_t i = 0; i < xs.size(); i++ ) {
        if ( xs[i].t > 0 && ( !best || xs[i].t < best->t ) )
            best = &xs[i];
    }
    return best;
}

static real_t refractive_index_of( const std::vector<const Shape*>& containers )
{
    return containers.empty() ? REFRACTIVE_INDEX_VACUUM
                              : containers.back()->material().refractive_index;
}

IntersectionState prepare_computations( const Intersection& hit, const Ray& r,
                                        const IntersectionList& xs )
{
    IntersectionState comps;
    comps.t = hit.t;
    comps.object = hit.object;
    comps.point = r.position( hit.t );
    comps.eyev = -r.d;
    comps.normalv = hit.object->normal( comps.point, hit );

    comps.inside = dot( comps.normalv, comps.eyev ) < 0;
    if ( comps.inside )
        comps.normalv = -comps.normalv;

    comps.reflectv = reflect( r.d, comps.normalv );
    comps.over_point = comps.point + comps.normalv * SHADOW_EPSILON;
    comps.under_point = comps.point - comps.normalv * SHADOW_EPSILON;

    // walk the hits in order, tracking which objects the ray is inside of
    comps.n1 = comps.n2 = REFRACTIVE_INDEX_VACUUM;
    std::vector<const Shape*> containers;
    bool found = false;

    for ( size_t i = 0; i < xs.size() && !found; i++ ) {
        const Intersection& x = xs[i];
        bool is_hit = x == hit;

        if ( is_hit )
            comps.n1 = refractive_index_of( containers );

        std::vector<const Shape*>::iterator pos =
            std::find( containers.begin(), containers.end(), x.object );
        if ( pos != containers.end() )
            containers.erase( pos );
        else
            containers.push_back( x.object );

        if ( is_hit ) {
            comps.n2 = refractive_index_of( containers );
            found = true;
        }
    }

    return comps;
}

IntersectionState prepare_computations( const Intersection& hit, const Ray& r )
{
    IntersectionList xs( 1, hit );
    return prepare_computations( hit, r, xs );
}

real_t schlick( const IntersectionState& comps )
{
    real_t cos_i = dot( comps.eyev, comps.normalv );

    // total internal reflection
    if ( comps.n1 > comps.n2 ) {
        real_t ratio = comps.n1 / comps.n2;
        real_t sin2_t = ratio * ratio * ( 1.0 - cos_i * cos_i );
        if ( sin2_t > 1.0 )
            return 1.0;
        cos_i = std::sqrt( 1.0 - sin2_t );
    }

    real_t r0 = ( comps.n1 - comps.n2 ) / ( comps.n1 + comps.n2 );
    r0 = r0 * r0;
    return r0 + ( 1 - r0 ) * std::pow( 1 - cos_i, 5 );
}

} /* lumen */
