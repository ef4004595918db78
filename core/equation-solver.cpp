
#include "equation-solver.h"

#include <cmath>

#define LARGE_RATIO 1e10

namespace dmlgeom {

int solveQuadratic(double x[2], double a, double b, double c) {
    // a == 0 -> linear equation
    if (a == 0 || fabs(b) > LARGE_RATIO*fabs(a)) {
        // a == 0, b == 0 -> no solution
        if (b == 0) {
            if (c == 0)
                return -1; // 0 == 0
            return 0;
        }
        x[0] = -c/b;
        return 1;
    }
    double dscr = b*b-4*a*c;
    if (dscr > 0) {
        dscr = sqrt(dscr);
        x[0] = (-b+dscr)/(a+a);
        x[1] = (-b-dscr)/(a+a);
        return 2;
    } else if (dscr == 0) {
        x[0] = -b/(a+a);
        return 1;
    } else
        return 0;
}

}
