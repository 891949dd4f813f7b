
#include "point.hpp"

namespace lumen {

PointLight::PointLight()
    : position(Tuple::Origin()), intensity(Color3::White()) { }

bool operator==(const PointLight &lhs, const PointLight &rhs) {
	return lhs.position == rhs.position && lhs.intensity == rhs.intensity;
}

}
