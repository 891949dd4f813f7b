/**
 * @file obj_loader.cpp
 * @brief Line-based OBJ parsing and export into shape groups.
 */

#include "application/obj_loader.hpp"
#include "scene/arena.hpp"
#include "scene/group.hpp"
#include "scene/triangle.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace lumen {

const char ObjLoader::DEFAULT_GROUP_NAME[] = "default";

// parses a whole token as a positive index, 0 on anything else
static size_t parse_index( const std::string& token )
{
    if ( token.empty() )
        return 0;

    const char* begin = token.c_str();
    char* end = 0;
    long value = strtol( begin, &end, 10 );
    if ( *end != '\0' || value <= 0 )
        return 0;
    return (size_t) value;
}

/*
Splits a face vertex of the form a, a/b, a/b/c or a//c into its position and
normal index. The texture index is ignored. A missing normal is 0.
*/
static bool parse_face_vertex( const std::string& token, size_t* p, size_t* n )
{
    std::vector<std::string> parts;
    std::stringstream ss( token );
    std::string part;
    while ( std::getline( ss, part, '/' ) )
        parts.push_back( part );

    if ( parts.empty() || parts.size() > 3 )
        return false;

    *p = parse_index( parts[0] );
    *n = 0;
    if ( parts.size() == 3 ) {
        *n = parse_index( parts[2] );
        if ( *n == 0 )
            return false;
    }
    return *p != 0;
}

ObjLoader::ObjLoader() : ignored_lines( 0 ) { }

ObjLoader::FaceGroup* ObjLoader::find_group( const std::string& name )
{
    for ( size_t i = 0; i < groups.size(); i++ ) {
        if ( groups[i].name == name )
            return &groups[i];
    }
    return 0;
}

const ObjLoader::FaceGroup* ObjLoader::find_group( const std::string& name ) const
{
    for ( size_t i = 0; i < groups.size(); i++ ) {
        if ( groups[i].name == name )
            return &groups[i];
    }
    return 0;
}

bool ObjLoader::parse_face( std::istream& tokens, int line_number, FaceGroup* group )
{
    std::vector<size_t> positions;
    std::vector<size_t> face_normals;
    bool smooth = true;
    std::string token;

    while ( tokens >> token ) {
        size_t p, n;
        if ( !parse_face_vertex( token, &p, &n ) ) {
            std::cout << "ERROR, line " << line_number << "; bad face vertex '" << token << "'.\n";
            return false;
        }
        if ( p > vertices.size() ) {
            std::cout << "ERROR, line " << line_number << "; no vertex " << p << ".\n";
            return false;
        }
        if ( n > normals.size() ) {
            std::cout << "ERROR, line " << line_number << "; no normal " << n << ".\n";
            return false;
        }
        smooth = smooth && n != 0;
        positions.push_back( p );
        face_normals.push_back( n );
    }

    if ( positions.size() < 3 ) {
        ignored_lines++;
        return true;
    }

    // fan triangulation around the first vertex
    for ( size_t i = 1; i + 1 < positions.size(); i++ ) {
        Face face;
        face.p[0] = positions[0];
        face.p[1] = positions[i];
        face.p[2] = positions[i + 1];
        face.n[0] = smooth ? face_normals[0] : 0;
        face.n[1] = smooth ? face_normals[i] : 0;
        face.n[2] = smooth ? face_normals[i + 1] : 0;
        group->faces.push_back( face );
    }
    return true;
}

bool ObjLoader::parse( std::istream& in )
{
    vertices.clear();
    normals.clear();
    groups.clear();
    ignored_lines = 0;

    FaceGroup default_group;
    default_group.name = DEFAULT_GROUP_NAME;
    groups.push_back( default_group );
    size_t current = 0;

    std::string line;
    int line_number = 0;

    while ( std::getline( in, line ) ) {
        line_number++;
        std::istringstream iss( line );
        std::string type;
        iss >> type;

        if ( type == "v" || type == "vn" ) {
            real_t x, y, z;
            if ( !( iss >> x >> y >> z ) ) {
                ignored_lines++;
                continue;
            }
            if ( type == "v" )
                vertices.push_back( Tuple::point( x, y, z ) );
            else
                normals.push_back( Tuple::vector( x, y, z ) );
        } else if ( type == "f" ) {
            if ( !parse_face( iss, line_number, &groups[current] ) )
                return false;
        } else if ( type == "g" ) {
            std::string name;
            if ( !( iss >> name ) ) {
                ignored_lines++;
                continue;
            }
            FaceGroup* existing = find_group( name );
            if ( existing ) {
                current = (size_t) ( existing - &groups[0] );
            } else {
                FaceGroup group;
                group.name = name;
                groups.push_back( group );
                current = groups.size() - 1;
            }
        } else {
            ignored_lines++;
        }
    }

    return true;
}

bool ObjLoader::load( const char* filename )
{
    std::ifstream file( filename );
    if ( !file ) {
        std::cout << "Error opening OBJ file '" << filename << "'.\n";
        return false;
    }
    return parse( file );
}

const Tuple& ObjLoader::vertex( size_t index ) const
{
    if ( index == 0 || index > vertices.size() )
        throw std::out_of_range( "OBJ vertex index out of range" );
    return vertices[index - 1];
}

const Tuple& ObjLoader::normal( size_t index ) const
{
    if ( index == 0 || index > normals.size() )
        throw std::out_of_range( "OBJ normal index out of range" );
    return normals[index - 1];
}

size_t ObjLoader::num_triangles( const std::string& name ) const
{
    const FaceGroup* group = find_group( name );
    return group ? group->faces.size() : 0;
}

Group* ObjLoader::build_group( ShapeArena& arena, const FaceGroup& face_group ) const
{
    Group* group = arena.create<Group>();

    for ( size_t i = 0; i < face_group.faces.size(); i++ ) {
        const Face& f = face_group.faces[i];
        Triangle* triangle;

        if ( f.n[0] ) {
            triangle = arena.create<SmoothTriangle>(
                vertex( f.p[0] ), vertex( f.p[1] ), vertex( f.p[2] ),
                normal( f.n[0] ), normal( f.n[1] ), normal( f.n[2] ) );
        } else {
            triangle = arena.create<Triangle>(
                vertex( f.p[0] ), vertex( f.p[1] ), vertex( f.p[2] ) );
        }
        group->add_child( triangle );
    }

    return group;
}

Group* ObjLoader::export_group( ShapeArena& arena, const std::string& name ) const
{
    const FaceGroup* group = find_group( name );
    return group ? build_group( arena, *group ) : 0;
}

Group* ObjLoader::export_tree( ShapeArena& arena ) const
{
    Group* root = arena.create<Group>();
    for ( size_t i = 0; i < groups.size(); i++ )
        root->add_child( build_group( arena, groups[i] ) );
    return root;
}

} /* lumen */
