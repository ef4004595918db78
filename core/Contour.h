
#pragma once

#include <vector>
#include "EdgeHolder.h"

namespace dmlgeom {

/// A single closed or open contour of a shape.
class Contour {

public:
    /// The sequence of edges that make up the contour.
    std::vector<EdgeHolder> edges;
    /// Whether the path closed the contour explicitly.
    bool closed;

    Contour();
    /// Adds an edge to the contour.
    void addEdge(const EdgeHolder &edge);
    void addEdge(EdgeHolder &&edge);
    /// Adjusts the bounding box to fit the contour.
    void bound(double &l, double &b, double &r, double &t) const;

};

}
