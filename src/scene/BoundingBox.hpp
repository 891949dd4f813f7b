#ifndef _LUMEN_BOUNDING_BOX_HPP_
#define _LUMEN_BOUNDING_BOX_HPP_

#include "math/tuple.hpp"
#include "math/matrix.hpp"

namespace lumen {
class Ray;

/**
 * An axis-aligned box in some shape's object space. A default constructed
 * box is empty: it contains nothing and is hit by nothing.
 */
class BoundingBox
{
public:
    BoundingBox();
    BoundingBox(const Tuple& low, const Tuple& high);

    // the box spanning the whole space
    static BoundingBox Unbounded();

    //Extend the bounding box to accomodate the point
    void AddPoint(const Tuple& point);

    //combine with another bounding box to form a bigger bounding volume
    void AddBox(const BoundingBox& box);

    bool empty() const;
    // true if any extent is infinite
    bool unbounded() const;
    bool contains(const Tuple& point) const;

    /*
    The enclosing box of the 8 transformed corners. A box is not preserved
    as a box under rotation, so the parameters can't be transformed directly.
    Unbounded boxes stay unbounded.
    */
    BoundingBox transform(const Matrix& mat) const;

    //hit testing on the box (rays starting inside always hit)
    bool hit(const Ray& r) const;

    /*
    Slab test for one axis: the entry/exit parameters of a ray against the
    slab [min, max]. A direction component smaller than EPSILON means the
    ray is parallel to the slab; the parameters then become -inf/+inf when
    the origin is inside the slab and +inf/-inf (an empty span) otherwise.
    */
    static void check_axis(real_t origin, real_t direction, real_t min, real_t max,
                           real_t* tmin, real_t* tmax);

    Tuple lowCoord, highCoord;

    inline real_t extent(int dim)const
    {
        return highCoord[dim]-lowCoord[dim];
    }
    inline Tuple centroid()const
    {
        return lowCoord + (highCoord - lowCoord) * 0.5;
    }
};

bool operator==(const BoundingBox& lhs, const BoundingBox& rhs);

} /* lumen */
#endif
