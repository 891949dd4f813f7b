
#include "scene/BoundingBox.hpp"
#include "scene/ray.hpp"

namespace lumen {
BoundingBox::BoundingBox()
    :lowCoord(Tuple::point(INFINITY_REAL,INFINITY_REAL,INFINITY_REAL)),
     highCoord(Tuple::point(-INFINITY_REAL,-INFINITY_REAL,-INFINITY_REAL))
{
}

BoundingBox::BoundingBox(const Tuple& low, const Tuple& high)
    :lowCoord(Tuple::point(low.x,low.y,low.z)), highCoord(Tuple::point(high.x,high.y,high.z))
{
}

BoundingBox BoundingBox::Unbounded()
{
    return BoundingBox(Tuple::point(-INFINITY_REAL,-INFINITY_REAL,-INFINITY_REAL),
                       Tuple::point(INFINITY_REAL,INFINITY_REAL,INFINITY_REAL));
}

void BoundingBox::AddPoint(const Tuple& point)
{
	for(int i=0;i<3;i++)
	{
        if(lowCoord[i]>point[i])
            lowCoord[i] = point[i];
        if(highCoord[i]<point[i])
            highCoord[i] = point[i];
    }
}

void BoundingBox::AddBox(const BoundingBox& box)
{
    for(int i=0;i<3;i++)
    {
        if(lowCoord[i] > box.lowCoord[i])
            lowCoord[i] = box.lowCoord[i];
        if(highCoord[i]<box.highCoord[i])
            highCoord[i] = box.highCoord[i];
    }
}

bool BoundingBox::empty() const
{
    for(int i=0;i<3;i++)
    {
        if(lowCoord[i] > highCoord[i])
            return true;
    }
    return false;
}

bool BoundingBox::unbounded() const
{
    for(int i=0;i<3;i++)
    {
        if(std::isinf(lowCoord[i]) || std::isinf(highCoord[i]))
            return true;
    }
    return false;
}

bool BoundingBox::contains(const Tuple& point) const
{
    for(int i=0;i<3;i++)
    {
        if(point[i] < lowCoord[i] || point[i] > highCoord[i])
            return false;
    }
    return true;
}

BoundingBox BoundingBox::transform(const Matrix& mat) const
{
    if(empty())
        return BoundingBox();
    // 0 * inf would poison the corners with NaN
    if(unbounded())
        return Unbounded();

    const Tuple& l = lowCoord;
    const Tuple& h = highCoord;
    Tuple corners[] = {
        Tuple::point(l.x,l.y,l.z), Tuple::point(l.x,l.y,h.z),
        Tuple::point(l.x,h.y,l.z), Tuple::point(l.x,h.y,h.z),
        Tuple::point(h.x,l.y,l.z), Tuple::point(h.x,l.y,h.z),
        Tuple::point(h.x,h.y,l.z), Tuple::point(h.x,h.y,h.z)
    };

    BoundingBox result;
    for(int i=0;i<8;i++)
        result.AddPoint(mat*corners[i]);
    return result;
}

void BoundingBox::check_axis(real_t origin, real_t direction, real_t min, real_t max,
                             real_t* tmin, real_t* tmax)
{
    if(std::fabs(direction) >= EPSILON)
    {
        *tmin = (min - origin)/direction;
        *tmax = (max - origin)/direction;
        if(*tmin > *tmax)
            std::swap(*tmin,*tmax);
    }
    else if(origin >= min && origin <= max)
    {
        *tmin = -INFINITY_REAL;
        *tmax = INFINITY_REAL;
    }
    else
    {
        *tmin = INFINITY_REAL;
        *tmax = -INFINITY_REAL;
    }
}

bool BoundingBox::hit(const Ray& r)const
{
    if(empty())
        return false;

    real_t xmin, xmax, ymin, ymax, zmin, zmax;
    check_axis(r.e.x, r.d.x, lowCoord.x, highCoord.x, &xmin, &xmax);
    check_axis(r.e.y, r.d.y, lowCoord.y, highCoord.y, &ymin, &ymax);
    check_axis(r.e.z, r.d.z, lowCoord.z, highCoord.z, &zmin, &zmax);

    real_t maximin = std::max(std::max(xmin,ymin),zmin);
    real_t minimax = std::min(std::min(xmax,ymax),zmax);

    return maximin <= minimax;
}

bool operator==(const BoundingBox& lhs, const BoundingBox& rhs)
{
    return lhs.lowCoord == rhs.lowCoord && lhs.highCoord == rhs.highCoord;
}
}
