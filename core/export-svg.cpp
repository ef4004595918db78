
#ifndef _CRT_SECURE_NO_WARNINGS
#define _CRT_SECURE_NO_WARNINGS
#endif
#include "export-svg.h"

#include <cstdio>

namespace dmlgeom {

static void writeCoord(std::string &output, Point2 coord, int precision) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), " %.*g %.*g", precision, coord.x, precision, coord.y);
    output += buffer;
}

void shapeToSvgPathData(std::string &output, const Shape &shape, int precision) {
    output.clear();
    for (std::vector<Contour>::const_iterator contour = shape.contours.begin(); contour != shape.contours.end(); ++contour) {
        if (contour->edges.empty())
            continue;
        if (!output.empty())
            output += ' ';
        output += 'M';
        writeCoord(output, contour->edges.front()->controlPoints()[0], precision);
        for (std::vector<EdgeHolder>::const_iterator edge = contour->edges.begin(); edge != contour->edges.end(); ++edge) {
            const Point2 *p = (*edge)->controlPoints();
            switch ((*edge)->type()) {
                case (int) LinearSegment::EDGE_TYPE:
                    output += " L";
                    writeCoord(output, p[1], precision);
                    break;
                case (int) CubicSegment::EDGE_TYPE:
                    output += " C";
                    writeCoord(output, p[1], precision);
                    writeCoord(output, p[2], precision);
                    writeCoord(output, p[3], precision);
                    break;
            }
        }
        if (contour->closed)
            output += " Z";
    }
}

}
