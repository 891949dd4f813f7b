/**
 * @file obj_loader.hpp
 * @brief Importer for the geometry subset of Wavefront OBJ files.
 */

#ifndef _LUMEN_APPLICATION_OBJ_LOADER_HPP_
#define _LUMEN_APPLICATION_OBJ_LOADER_HPP_

#include "math/tuple.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace lumen {

class Group;
class ShapeArena;

/**
 * Reads vertices (v), vertex normals (vn), polygonal faces (f) and named
 * groups (g). Faces are fan-triangulated; a face whose every vertex names a
 * normal becomes smooth triangles. Faces before the first g line belong to
 * the group named "default". Every other line is skipped and counted.
 *
 * Parsing only collects triangle data; shapes are created when a group is
 * exported into an arena, so the same loader can be exported many times.
 */
class ObjLoader
{
public:

    static const char DEFAULT_GROUP_NAME[];

    ObjLoader();

    /**
     * Parses OBJ text, replacing anything parsed before.
     * @return false, with a message printed, if a face refers to a vertex or
     *  normal that hasn't been defined.
     */
    bool parse( std::istream& in );

    // parses the named file
    bool load( const char* filename );

    size_t num_ignored_lines() const { return ignored_lines; }

    // 1-based, as in the file; zero or out of range indices throw std::out_of_range
    const Tuple& vertex( size_t index ) const;
    const Tuple& normal( size_t index ) const;
    size_t num_vertices() const { return vertices.size(); }
    size_t num_normals() const { return normals.size(); }

    // triangles collected in the named group, 0 if there is no such group
    size_t num_triangles( const std::string& name ) const;

    /**
     * Creates the triangles of the named group in arena and returns a group
     * holding them, or null if no group has that name.
     */
    Group* export_group( ShapeArena& arena, const std::string& name ) const;

    // a root group with one child group per OBJ group, in file order
    Group* export_tree( ShapeArena& arena ) const;

private:

    struct Face
    {
        size_t p[3];
        // all zero for flat triangles
        size_t n[3];
    };

    struct FaceGroup
    {
        std::string name;
        std::vector<Face> faces;
    };

    FaceGroup* find_group( const std::string& name );
    const FaceGroup* find_group( const std::string& name ) const;
    Group* build_group( ShapeArena& arena, const FaceGroup& group ) const;
    bool parse_face( std::istream& tokens, int line_number, FaceGroup* group );

    std::vector<Tuple> vertices;
    std::vector<Tuple> normals;
    std::vector<FaceGroup> groups;
    size_t ignored_lines;
};

} /* lumen */

#endif /* _LUMEN_APPLICATION_OBJ_LOADER_HPP_ */
