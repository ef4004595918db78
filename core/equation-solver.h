
#pragma once

namespace dmlgeom {

// ax^2 + bx + c = 0
int solveQuadratic(double x[2], double a, double b, double c);

}
