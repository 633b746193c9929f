#include "OutlineTypes.hpp"

#include <algorithm>

namespace outline {

std::string headingLevelName(HeadingLevel level) {
  return "H" + std::to_string(static_cast<int>(level));
}

HeadingLevel headingLevelFromDepth(int depth) {
  return static_cast<HeadingLevel>(std::min(std::max(depth, 1), 4));
}

} // namespace outline
