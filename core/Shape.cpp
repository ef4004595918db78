
#include "Shape.h"

#include <cfloat>

namespace dmlgeom {

void Shape::addContour(const Contour &contour) {
    contours.push_back(contour);
}

void Shape::addContour(Contour &&contour) {
    contours.push_back((Contour &&) contour);
}

Contour &Shape::addContour() {
    contours.resize(contours.size()+1);
    return contours.back();
}

bool Shape::validate() const {
    for (std::vector<Contour>::const_iterator contour = contours.begin(); contour != contours.end(); ++contour) {
        if (!contour->edges.empty()) {
            Point2 corner = contour->edges.front()->controlPoints()[0];
            for (std::vector<EdgeHolder>::const_iterator edge = contour->edges.begin(); edge != contour->edges.end(); ++edge) {
                if (!*edge)
                    return false;
                if ((*edge)->point(0) != corner)
                    return false;
                corner = (*edge)->point(1);
            }
            if (contour->closed && corner != contour->edges.front()->point(0))
                return false;
        }
    }
    return true;
}

void Shape::bound(double &l, double &b, double &r, double &t) const {
    for (std::vector<Contour>::const_iterator contour = contours.begin(); contour != contours.end(); ++contour)
        contour->bound(l, b, r, t);
}

Shape::Bounds Shape::getBounds() const {
    Shape::Bounds bounds = { +DBL_MAX, +DBL_MAX, -DBL_MAX, -DBL_MAX };
    bound(bounds.l, bounds.b, bounds.r, bounds.t);
    return bounds;
}

int Shape::edgeCount() const {
    int total = 0;
    for (std::vector<Contour>::const_iterator contour = contours.begin(); contour != contours.end(); ++contour)
        total += (int) contour->edges.size();
    return total;
}

}
