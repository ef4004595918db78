
#pragma once

#include "edge-segments.h"

namespace dmlgeom {

/// Container for a single edge of dynamic type.
class EdgeHolder {

public:
    /// Swaps the edges held by a and b.
    static void swap(EdgeHolder &a, EdgeHolder &b);

    EdgeHolder();
    EdgeHolder(EdgeSegment *segment);
    EdgeHolder(Point2 p0, Point2 p1);
    EdgeHolder(Point2 p0, Point2 p1, Point2 p2, Point2 p3);
    EdgeHolder(const EdgeHolder &orig);
    EdgeHolder(EdgeHolder &&orig);
    ~EdgeHolder();
    EdgeHolder &operator=(const EdgeHolder &orig);
    EdgeHolder &operator=(EdgeHolder &&orig);
    EdgeSegment &operator*();
    const EdgeSegment &operator*() const;
    EdgeSegment *operator->();
    const EdgeSegment *operator->() const;
    operator EdgeSegment *();
    operator const EdgeSegment *() const;

private:
    EdgeSegment *edgeSegment;

};

}
