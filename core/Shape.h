
#pragma once

#include <vector>
#include "Contour.h"

namespace dmlgeom {

/// Vector geometry of a shape, as a list of contours made of lines and cubic curves.
class Shape {

public:
    struct Bounds {
        double l, b, r, t;
    };

    /// The list of contours the shape consists of.
    std::vector<Contour> contours;

    /// Adds a contour.
    void addContour(const Contour &contour);
    void addContour(Contour &&contour);
    /// Adds a blank contour and returns its reference.
    Contour &addContour();
    /// Performs basic checks to determine if the object represents a valid shape - every edge starts where the previous one ends.
    bool validate() const;
    /// Adjusts the bounding box to fit the shape.
    void bound(double &l, double &b, double &r, double &t) const;
    /// Computes the minimum bounding box that fits the shape. For an empty shape, l > r and b > t.
    Bounds getBounds() const;
    /// Returns the total number of edge segments
    int edgeCount() const;

};

}
