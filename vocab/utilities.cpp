#include "utilities.hpp"

namespace csgir {
namespace vocab {

Expression pairwise_hull(const Children& shapes) {
    Children hulls;
    for (std::size_t i = 1; i < shapes.size(); ++i) {
        hulls.push_back(hull({shapes[i - 1], shapes[i]}));
    }
    return union_(std::move(hulls));
}

Expression round_corners(double radius, Children shapes, bool round, bool chamfer) {
    Expression inner = offset(-radius, std::move(shapes), round, chamfer);
    return offset(radius, {std::move(inner)}, round, chamfer);
}

}  // namespace vocab
}  // namespace csgir
