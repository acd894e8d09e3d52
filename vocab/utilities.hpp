#ifndef CSGIR_VOCAB_UTILITIES_HPP
#define CSGIR_VOCAB_UTILITIES_HPP

#include "vocabulary.hpp"
#include <utility>

namespace csgir {
namespace vocab {

// The union of the hulls of each consecutive pair of shapes.
Expression pairwise_hull(const Children& shapes);

// Round off the corners of 2D shapes with an inset followed by an equal
// outset. The shapes must survive the inset.
Expression round_corners(double radius, Children shapes, bool round = true, bool chamfer = false);

// The union of the outputs of a mapping, like an OpenSCAD for statement.
template <typename Range, typename Fn>
Expression union_map(Fn&& fn, const Range& items) {
    Children children;
    for (const auto& item : items) {
        children.push_back(fn(item));
    }
    return union_(std::move(children));
}

}  // namespace vocab
}  // namespace csgir

#endif // CSGIR_VOCAB_UTILITIES_HPP
