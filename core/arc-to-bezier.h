
#pragma once

#include <vector>
#include "Vector2.hpp"
#include "geometry-status.h"

// Maximum arc parameter angle (in radians) spanned by a single cubic segment - 45 degrees
#define DMLGEOM_DEFAULT_ARC_SEGMENT_ANGLE 0.78539816339744830962
// Arcs which would need more cubic segments than this are rejected as degenerate
#ifndef DMLGEOM_MAX_ARC_SEGMENTS
#define DMLGEOM_MAX_ARC_SEGMENTS 4096
#endif

namespace dmlgeom {

/// A cubic Bezier curve given by its start point, two control points, and end point.
struct BezierSegment {
    Point2 p[4];

    inline BezierSegment() { }
    inline BezierSegment(Point2 p0, Point2 p1, Point2 p2, Point2 p3) {
        p[0] = p0, p[1] = p1, p[2] = p2, p[3] = p3;
    }
};

/// An elliptical arc in endpoint parameterization, as in the SVG path A command.
struct ArcParameters {
    /// Radii of the ellipse, the sign is ignored.
    Vector2 radius;
    /// Rotation of the ellipse's x axis in radians.
    double rotation;
    /// Selects the larger of the two arcs between the endpoints.
    bool largeArc;
    /// Selects the arc going in the direction of increasing angle.
    bool sweep;
    Point2 startPoint, endPoint;

    inline ArcParameters() : rotation(0), largeArc(false), sweep(false) { }
};

/**
 * Approximates an elliptical arc by a sequence of cubic Bezier segments, each spanning at most
 * maxSegmentAngle of the ellipse parameter. If the radii are too small to connect the endpoints,
 * they are scaled up uniformly. On success, output is replaced by at least one segment.
 * Returns GEOMETRY_DEGENERATE and leaves output untouched for a zero radius, coincident endpoints,
 * non-finite input, or a segment angle which is not positive or would need more than DMLGEOM_MAX_ARC_SEGMENTS segments.
 */
GeometryStatus arcToBeziers(std::vector<BezierSegment> &output, Vector2 radius, double rotation, bool largeArc, bool sweep, Point2 startPoint, Point2 endPoint, double maxSegmentAngle = DMLGEOM_DEFAULT_ARC_SEGMENT_ANGLE);
GeometryStatus arcToBeziers(std::vector<BezierSegment> &output, const ArcParameters &arc, double maxSegmentAngle = DMLGEOM_DEFAULT_ARC_SEGMENT_ANGLE);

/// Returns the Bezier segment approximating the arc of the ellipse with the given center, radii and rotation axis (cosine, sine) between parameters eta1 and eta2.
BezierSegment ellipticArcSegment(Point2 center, Vector2 radius, Vector2 axis, double eta1, double eta2);

}
