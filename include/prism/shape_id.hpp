#ifndef PRISM_SHAPE_ID_HPP
#define PRISM_SHAPE_ID_HPP

#include <cstddef>

namespace prism {

// Handle into a SceneGraph arena. Equality of handles is shape identity.
using ShapeId = std::size_t;
constexpr ShapeId NO_SHAPE = static_cast<ShapeId>(-1);

class SceneGraph;

}

#endif
