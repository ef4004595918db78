
#include "Contour.h"

namespace dmlgeom {

Contour::Contour() : closed(false) { }

void Contour::addEdge(const EdgeHolder &edge) {
    edges.push_back(edge);
}

void Contour::addEdge(EdgeHolder &&edge) {
    edges.push_back((EdgeHolder &&) edge);
}

void Contour::bound(double &l, double &b, double &r, double &t) const {
    for (std::vector<EdgeHolder>::const_iterator edge = edges.begin(); edge != edges.end(); ++edge)
        (*edge)->bound(l, b, r, t);
}

}
