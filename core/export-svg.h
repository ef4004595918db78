
#pragma once

#include <string>
#include "Shape.h"

namespace dmlgeom {

/// Writes the shape as SVG path data ("M x y L x y C x1 y1 x2 y2 x y Z") with the given number of significant digits.
void shapeToSvgPathData(std::string &output, const Shape &shape, int precision = 9);

}
