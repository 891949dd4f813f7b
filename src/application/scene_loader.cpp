/**
 * @file scene_loader.cpp
 * @brief Scene Loader
 */

#include "application/scene_loader.hpp"
#include "application/obj_loader.hpp"

#include "scene/scene.hpp"
#include "scene/sphere.hpp"
#include "scene/plane.hpp"
#include "scene/cube.hpp"
#include "scene/cylinder.hpp"
#include "scene/triangle.hpp"
#include "scene/group.hpp"
#include "material/material.hpp"
#include "material/pattern.hpp"
#include "light/point.hpp"

#include <tinyxml.h>

#include <iostream>
#include <map>
#include <cstring>
#include <sstream>

namespace lumen {

struct StrCompare
{
    bool operator() ( const char* s1, const char* s2 ) const
    {
        return strcmp( s1, s2 ) < 0;
    }
};

// map from strings to materials
typedef std::map< const char*, Material, StrCompare > MaterialMap;
// map from strings to patterns
typedef std::map< const char*, const Pattern*, StrCompare > PatternMap;

// everything defined so far that later elements may refer to by name
struct LoadState
{
    Scene* scene;
    MaterialMap materials;
    PatternMap patterns;
    bool has_light;
};

static const char STR_SCENE[] = "scene";
static const char STR_CAMERA[] = "camera";
static const char STR_WIDTH[] = "width";
static const char STR_HEIGHT[] = "height";
static const char STR_FOV[] = "fov";
static const char STR_FROM[] = "from";
static const char STR_TO[] = "to";
static const char STR_UP[] = "up";
static const char STR_PLIGHT[] = "point_light";
static const char STR_POSITION[] = "position";
static const char STR_INTENSITY[] = "intensity";
static const char STR_PATTERN[] = "pattern";
static const char STR_TYPE[] = "type";
static const char STR_COLOR_A[] = "color_a";
static const char STR_COLOR_B[] = "color_b";
static const char STR_PATTERN_A[] = "pattern_a";
static const char STR_PATTERN_B[] = "pattern_b";
static const char STR_MATERIAL[] = "material";
static const char STR_NAME[] = "name";
static const char STR_COLOR[] = "color";
static const char STR_AMBIENT[] = "ambient";
static const char STR_DIFFUSE[] = "diffuse";
static const char STR_SPECULAR[] = "specular";
static const char STR_SHININESS[] = "shininess";
static const char STR_REFLECTIVE[] = "reflective";
static const char STR_TRANSPARENCY[] = "transparency";
static const char STR_REFRACT[] = "refractive_index";
static const char STR_SHADOW[] = "shadow";
static const char STR_TRANSFORM[] = "transform";
static const char STR_TRANSLATE[] = "translate";
static const char STR_SCALE[] = "scale";
static const char STR_ROTATE[] = "rotate";
static const char STR_SHEAR[] = "shear";
static const char STR_AXIS[] = "axis";
static const char STR_SPHERE[] = "sphere";
static const char STR_PLANE[] = "plane";
static const char STR_CUBE[] = "cube";
static const char STR_CYLINDER[] = "cylinder";
static const char STR_MINIMUM[] = "minimum";
static const char STR_MAXIMUM[] = "maximum";
static const char STR_CLOSED[] = "closed";
static const char STR_TRIANGLE[] = "triangle";
static const char STR_SMOOTH_TRIANGLE[] = "smooth_triangle";
static const char STR_P1[] = "p1";
static const char STR_P2[] = "p2";
static const char STR_P3[] = "p3";
static const char STR_N1[] = "n1";
static const char STR_N2[] = "n2";
static const char STR_N3[] = "n3";
static const char STR_GROUP[] = "group";
static const char STR_MODEL[] = "model";
static const char STR_FILENAME[] = "filename";

static void print_error_header( const TiXmlElement* base )
{
    std::cout << "ERROR, " << base->Row() << ":" << base->Column() << "; "
        << "in " << base->Value() << ", ";
}

// prints the error at elem and aborts the load
static void throw_error( const TiXmlElement* elem, const std::string& msg )
{
    print_error_header( elem );
    std::cout << msg << "\n";

    std::ostringstream what;
    what << elem->Row() << ":" << elem->Column() << ": " << msg;
    throw SceneLoadError( what.str() );
}

static const TiXmlElement* get_unique_child( const TiXmlElement* parent, bool required, const char* name )
{
    const TiXmlElement* elem = parent->FirstChildElement( name );

    if ( !elem ) {
        if ( required )
            throw_error( parent, std::string( "no '" ) + name + "' defined." );
        return 0;
    }

    if ( elem->NextSiblingElement( name ) )
        throw_error( elem, std::string( "'" ) + name + "' multiply defined." );

    return elem;
}

static void parse_attrib_int( const TiXmlElement* elem, bool required, const char* name, int* val )
{
    int rv = elem->QueryIntAttribute( name, val );
    if ( rv == TIXML_WRONG_TYPE ) {
        throw_error( elem, std::string( "error parsing '" ) + name + "'." );
    } else if ( required && rv == TIXML_NO_ATTRIBUTE ) {
        throw_error( elem, std::string( "missing '" ) + name + "'." );
    }
}

static void parse_attrib_double( const TiXmlElement* elem, bool required, const char* name, double* val )
{
    int rv = elem->QueryDoubleAttribute( name, val );
    if ( rv == TIXML_WRONG_TYPE ) {
        throw_error( elem, std::string( "error parsing '" ) + name + "'." );
    } else if ( required && rv == TIXML_NO_ATTRIBUTE ) {
        throw_error( elem, std::string( "missing '" ) + name + "'." );
    }
}

static void parse_attrib_string( const TiXmlElement* elem, bool required, const char* name, const char** val )
{
    const char* att = elem->Attribute( name );
    if ( !att && required ) {
        throw_error( elem, std::string( "missing '" ) + name + "'." );
    } else if ( att ) {
        *val = att;
    }
}

static void parse_attrib_bool( const TiXmlElement* elem, const char* name, bool* val )
{
    const char* att = 0;
    parse_attrib_string( elem, false, name, &att );
    if ( !att )
        return;

    if ( strcmp( att, "true" ) == 0 || strcmp( att, "1" ) == 0 ) {
        *val = true;
    } else if ( strcmp( att, "false" ) == 0 || strcmp( att, "0" ) == 0 ) {
        *val = false;
    } else {
        throw_error( elem, std::string( "'" ) + name + "' must be true or false." );
    }
}

template< typename T >
static void parse_elem( const TiXmlElement* elem, T* val );

template<> void parse_elem< double >( const TiXmlElement* elem, double* d )
{
    parse_attrib_double( elem, true, "v", d );
}

template<> void parse_elem< Color3 >( const TiXmlElement* elem, Color3* color )
{
    parse_attrib_double( elem, true, "r", &color->r );
    parse_attrib_double( elem, true, "g", &color->g );
    parse_attrib_double( elem, true, "b", &color->b );
}

// parses x, y, z, leaving w as it is, so the caller decides point or vector
template<> void parse_elem< Tuple >( const TiXmlElement* elem, Tuple* tuple )
{
    parse_attrib_double( elem, true, "x", &tuple->x );
    parse_attrib_double( elem, true, "y", &tuple->y );
    parse_attrib_double( elem, true, "z", &tuple->z );
}

template< typename T >
static void parse_elem( const TiXmlElement* parent, bool required, const char* name, T* val )
{
    const TiXmlElement* child = get_unique_child( parent, required, name );
    if ( child )
        parse_elem< T >( child, val );
}

static Tuple parse_point( const TiXmlElement* parent, const char* name )
{
    Tuple p = Tuple::point( 0, 0, 0 );
    parse_elem( parent, true, name, &p );
    return p;
}

static Tuple parse_vector( const TiXmlElement* parent, const char* name )
{
    Tuple v = Tuple::vector( 0, 0, 0 );
    parse_elem( parent, true, name, &v );
    return v;
}

template< typename T >
static void parse_lookup_data( const std::map< const char*, T, StrCompare >& tmap, const TiXmlElement* elem, const char* name, T* val )
{
    typename std::map< const char*, T, StrCompare >::const_iterator iter;
    const char* att;

    parse_attrib_string( elem, true, name, &att );
    iter = tmap.find( att );
    if ( iter == tmap.end() )
        throw_error( elem, std::string( "No such " ) + name + " '" + att + "'." );
    *val = iter->second;
}

/*
The children of a <transform> element, chained in reading order: the first
child is applied to the shape first.
*/
static Matrix parse_transform( const TiXmlElement* elem )
{
    Matrix result = Matrix::identity( 4 );

    for ( const TiXmlElement* child = elem->FirstChildElement(); child; child = child->NextSiblingElement() ) {
        const char* op = child->Value();

        if ( strcmp( op, STR_TRANSLATE ) == 0 ) {
            Tuple t;
            parse_elem( child, &t );
            result = result.translate( t.x, t.y, t.z );
        } else if ( strcmp( op, STR_SCALE ) == 0 ) {
            Tuple s;
            parse_elem( child, &s );
            result = result.scale( s.x, s.y, s.z );
        } else if ( strcmp( op, STR_ROTATE ) == 0 ) {
            const char* axis_name;
            double angle;
            parse_attrib_string( child, true, STR_AXIS, &axis_name );
            parse_attrib_double( child, true, "a", &angle );

            Axis axis;
            if ( strcmp( axis_name, "x" ) == 0 ) {
                axis = X_AXIS;
            } else if ( strcmp( axis_name, "y" ) == 0 ) {
                axis = Y_AXIS;
            } else if ( strcmp( axis_name, "z" ) == 0 ) {
                axis = Z_AXIS;
            } else {
                throw_error( child, std::string( "unknown axis '" ) + axis_name + "'." );
                axis = X_AXIS;
            }
            result = result.rotate( axis, angle );
        } else if ( strcmp( op, STR_SHEAR ) == 0 ) {
            double xy, xz, yx, yz, zx, zy;
            parse_attrib_double( child, true, "xy", &xy );
            parse_attrib_double( child, true, "xz", &xz );
            parse_attrib_double( child, true, "yx", &yx );
            parse_attrib_double( child, true, "yz", &yz );
            parse_attrib_double( child, true, "zx", &zx );
            parse_attrib_double( child, true, "zy", &zy );
            result = result.shear( xy, xz, yx, yz, zx, zy );
        } else {
            throw_error( child, std::string( "unknown transform '" ) + op + "'." );
        }
    }

    return result;
}

// the optional <transform> child of elem; identity if there is none
static Matrix parse_optional_transform( const TiXmlElement* elem )
{
    const TiXmlElement* child = get_unique_child( elem, false, STR_TRANSFORM );
    return child ? parse_transform( child ) : Matrix::identity( 4 );
}

static void check_invertible( const TiXmlElement* elem, const Matrix& mat )
{
    if ( !mat.invertible() )
        throw_error( elem, "transform is not invertible." );
}

static void parse_camera( const TiXmlElement* elem, Camera* camera )
{
    int width, height;
    double fov;

    parse_attrib_int( elem, true, STR_WIDTH, &width );
    parse_attrib_int( elem, true, STR_HEIGHT, &height );
    parse_attrib_double( elem, true, STR_FOV, &fov );

    if ( width <= 0 || height <= 0 )
        throw_error( elem, "camera size must be positive." );
    if ( fov <= 0 || fov >= PI )
        throw_error( elem, "fov must be between 0 and pi." );

    Tuple from = parse_point( elem, STR_FROM );
    Tuple to = parse_point( elem, STR_TO );
    Tuple up = parse_vector( elem, STR_UP );

    Matrix view = Matrix::view_transform( from, to, up );
    check_invertible( elem, view );

    *camera = Camera( width, height, fov );
    camera->set_transform( view );
}

static void parse_point_light( const TiXmlElement* elem, PointLight* light )
{
    light->position = parse_point( elem, STR_POSITION );
    parse_elem( elem, true, STR_INTENSITY, &light->intensity );
}

// a pen is a flat color child or a named earlier pattern
static void parse_pen( const LoadState& state, const TiXmlElement* elem,
                       const char* color_name, const char* pattern_name, PatternPen* pen )
{
    if ( elem->Attribute( pattern_name ) ) {
        const Pattern* nested;
        parse_lookup_data( state.patterns, elem, pattern_name, &nested );
        *pen = PatternPen( nested );
    } else {
        Color3 color = pen->color;
        parse_elem( elem, false, color_name, &color );
        *pen = PatternPen( color );
    }
}

static Pattern* create_pattern( const TiXmlElement* elem )
{
    const char* type;
    parse_attrib_string( elem, true, STR_TYPE, &type );

    if ( strcmp( type, "stripe" ) == 0 )
        return new StripePattern();
    if ( strcmp( type, "gradient" ) == 0 )
        return new GradientPattern();
    if ( strcmp( type, "ring" ) == 0 )
        return new RingPattern();
    if ( strcmp( type, "checkers" ) == 0 )
        return new CheckersPattern();

    throw_error( elem, std::string( "unknown pattern type '" ) + type + "'." );
    return 0;
}

static void parse_pattern( LoadState& state, const TiXmlElement* elem )
{
    const char* name;
    parse_attrib_string( elem, true, STR_NAME, &name );

    Pattern* pattern = create_pattern( elem );
    // owned by the scene from here on, so it's freed on error too
    state.scene->add_pattern( pattern );

    parse_pen( state, elem, STR_COLOR_A, STR_PATTERN_A, &pattern->a );
    parse_pen( state, elem, STR_COLOR_B, STR_PATTERN_B, &pattern->b );
    pattern->transform = parse_optional_transform( elem );
    check_invertible( elem, pattern->transform );

    if ( !state.patterns.insert( std::make_pair( name, pattern ) ).second )
        throw_error( elem, std::string( "Pattern '" ) + name + "' multiply defined." );
}

static void parse_material( LoadState& state, const TiXmlElement* elem )
{
    const char* name;
    Material material;

    parse_attrib_string( elem, true, STR_NAME, &name );

    if ( elem->Attribute( STR_PATTERN ) )
        parse_lookup_data( state.patterns, elem, STR_PATTERN, &material.pattern );

    parse_elem( elem, false, STR_COLOR,        &material.color );
    parse_elem( elem, false, STR_AMBIENT,      &material.ambient );
    parse_elem( elem, false, STR_DIFFUSE,      &material.diffuse );
    parse_elem( elem, false, STR_SPECULAR,     &material.specular );
    parse_elem( elem, false, STR_SHININESS,    &material.shininess );
    parse_elem( elem, false, STR_REFLECTIVE,   &material.reflective );
    parse_elem( elem, false, STR_TRANSPARENCY, &material.transparency );
    parse_elem( elem, false, STR_REFRACT,      &material.refractive_index );

    // check for repeat name
    if ( !state.materials.insert( std::make_pair( name, material ) ).second )
        throw_error( elem, std::string( "Material '" ) + name + "' multiply defined." );
}

static bool is_shape_element( const char* value )
{
    static const char* const SHAPE_NAMES[] = {
        STR_SPHERE, STR_PLANE, STR_CUBE, STR_CYLINDER, STR_TRIANGLE,
        STR_SMOOTH_TRIANGLE, STR_GROUP, STR_MODEL
    };

    for ( size_t i = 0; i < sizeof SHAPE_NAMES / sizeof SHAPE_NAMES[0]; i++ ) {
        if ( strcmp( value, SHAPE_NAMES[i] ) == 0 )
            return true;
    }
    return false;
}

static Shape* parse_shape( LoadState& state, const TiXmlElement* elem );

static Shape* parse_group( LoadState& state, const TiXmlElement* elem )
{
    Group* group = state.scene->shapes().create<Group>();

    for ( const TiXmlElement* child = elem->FirstChildElement(); child; child = child->NextSiblingElement() ) {
        if ( strcmp( child->Value(), STR_TRANSFORM ) == 0 )
            continue;
        if ( !is_shape_element( child->Value() ) )
            throw_error( child, std::string( "'" ) + child->Value() + "' is not a shape." );
        group->add_child( parse_shape( state, child ) );
    }

    return group;
}

static Shape* parse_model( LoadState& state, const TiXmlElement* elem )
{
    const char* filename;
    parse_attrib_string( elem, true, STR_FILENAME, &filename );

    ObjLoader loader;
    if ( !loader.load( filename ) )
        throw_error( elem, std::string( "could not load model '" ) + filename + "'." );

    if ( loader.num_ignored_lines() )
        std::cout << "Model '" << filename << "': ignored " << loader.num_ignored_lines() << " lines.\n";

    return loader.export_tree( state.scene->shapes() );
}

static Shape* create_shape( LoadState& state, const TiXmlElement* elem )
{
    ShapeArena& arena = state.scene->shapes();
    const char* type = elem->Value();

    if ( strcmp( type, STR_SPHERE ) == 0 )
        return arena.create<Sphere>();
    if ( strcmp( type, STR_PLANE ) == 0 )
        return arena.create<Plane>();
    if ( strcmp( type, STR_CUBE ) == 0 )
        return arena.create<Cube>();

    if ( strcmp( type, STR_CYLINDER ) == 0 ) {
        Cylinder* cylinder = arena.create<Cylinder>();
        parse_attrib_double( elem, false, STR_MINIMUM, &cylinder->minimum );
        parse_attrib_double( elem, false, STR_MAXIMUM, &cylinder->maximum );
        parse_attrib_bool( elem, STR_CLOSED, &cylinder->closed );
        return cylinder;
    }

    if ( strcmp( type, STR_TRIANGLE ) == 0 ) {
        return arena.create<Triangle>( parse_point( elem, STR_P1 ),
                                       parse_point( elem, STR_P2 ),
                                       parse_point( elem, STR_P3 ) );
    }

    if ( strcmp( type, STR_SMOOTH_TRIANGLE ) == 0 ) {
        return arena.create<SmoothTriangle>( parse_point( elem, STR_P1 ),
                                             parse_point( elem, STR_P2 ),
                                             parse_point( elem, STR_P3 ),
                                             parse_vector( elem, STR_N1 ),
                                             parse_vector( elem, STR_N2 ),
                                             parse_vector( elem, STR_N3 ) );
    }

    if ( strcmp( type, STR_GROUP ) == 0 )
        return parse_group( state, elem );
    if ( strcmp( type, STR_MODEL ) == 0 )
        return parse_model( state, elem );

    throw_error( elem, std::string( "unknown shape '" ) + type + "'." );
    return 0;
}

/*
Creates the shape, then applies the attributes every shape shares. The
transform is set before the shape is handed to a parent group, whose cached
bounds depend on it.
*/
static Shape* parse_shape( LoadState& state, const TiXmlElement* elem )
{
    Shape* shape = create_shape( state, elem );

    if ( elem->Attribute( STR_MATERIAL ) ) {
        Material material;
        parse_lookup_data( state.materials, elem, STR_MATERIAL, &material );
        shape->set_material( material );
    }

    parse_attrib_bool( elem, STR_SHADOW, &shape->casts_shadow );

    Matrix transform = parse_optional_transform( elem );
    check_invertible( elem, transform );
    shape->set_transform( transform );

    return shape;
}

static void parse_document( Scene* scene, const TiXmlDocument& doc )
{
    const TiXmlElement* root = doc.RootElement();
    if ( !root )
        throw SceneLoadError( "no root element" );

    if ( strcmp( root->Value(), STR_SCENE ) != 0 )
        throw_error( root, "root element must be 'scene'." );

    LoadState state;
    state.scene = scene;
    state.has_light = false;

    // the camera is required, but may appear anywhere
    get_unique_child( root, true, STR_CAMERA );

    // everything else is read in document order, so names must be defined before use
    for ( const TiXmlElement* elem = root->FirstChildElement(); elem; elem = elem->NextSiblingElement() ) {
        const char* value = elem->Value();

        if ( strcmp( value, STR_CAMERA ) == 0 ) {
            parse_camera( elem, &scene->camera );
        } else if ( strcmp( value, STR_PLIGHT ) == 0 ) {
            if ( state.has_light )
                throw_error( elem, "only one point_light is supported." );
            parse_point_light( elem, &scene->world.light );
            state.has_light = true;
        } else if ( strcmp( value, STR_PATTERN ) == 0 ) {
            parse_pattern( state, elem );
        } else if ( strcmp( value, STR_MATERIAL ) == 0 ) {
            parse_material( state, elem );
        } else if ( is_shape_element( value ) ) {
            scene->world.add_object( parse_shape( state, elem ) );
        } else {
            throw_error( elem, std::string( "unknown element '" ) + value + "'." );
        }
    }
}

// parses doc into scene, or leaves scene empty and returns false
static bool load_document( Scene* scene, const TiXmlDocument& doc )
{
    scene->reset();

    try {
        parse_document( scene, doc );
    } catch ( const std::exception& e ) {
        std::cout << "Scene load failed: " << e.what() << "\n";
        scene->reset();
        return false;
    }

    return true;
}

bool load_scene( Scene* scene, const char* filename )
{
    TiXmlDocument doc( filename );

    // load the document
    if ( !doc.LoadFile() ) {
        std::cout << "ERROR, " << doc.ErrorRow() << ":" << doc.ErrorCol() << "; "
            << "parse error: " << doc.ErrorDesc() << "\n";
        scene->reset();
        return false;
    }

    return load_document( scene, doc );
}

bool load_scene_from_string( Scene* scene, const char* text )
{
    TiXmlDocument doc;

    doc.Parse( text );
    if ( doc.Error() ) {
        std::cout << "ERROR, " << doc.ErrorRow() << ":" << doc.ErrorCol() << "; "
            << "parse error: " << doc.ErrorDesc() << "\n";
        scene->reset();
        return false;
    }

    return load_document( scene, doc );
}

} /* lumen */
