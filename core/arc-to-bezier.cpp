
#ifndef _USE_MATH_DEFINES
#define _USE_MATH_DEFINES
#endif
#include "arc-to-bezier.h"

#include <cmath>
#include "arithmetics.hpp"

// Remainders of the arc shorter than this are merged into the last segment
#define ARC_ANGLE_EPSILON 1e-9

namespace dmlgeom {

// Signed angle from u to v, positive if v lies counter-clockwise of u (in y-up coordinates)
static double arcAngle(Vector2 u, Vector2 v) {
    double angle = acos(clamp(dotProduct(u, v)/(u.length()*v.length()), -1., +1.));
    return crossProduct(u, v) < 0 ? -angle : angle;
}

static Point2 ellipticArcPoint(Point2 center, Vector2 radius, Vector2 axis, double eta) {
    return center+(radius*Vector2(cos(eta), sin(eta))).rotate(axis);
}

static Vector2 ellipticArcDerivative(Vector2 radius, Vector2 axis, double eta) {
    return (radius*Vector2(-sin(eta), cos(eta))).rotate(axis);
}

BezierSegment ellipticArcSegment(Point2 center, Vector2 radius, Vector2 axis, double eta1, double eta2) {
    double halfTan = tan(.5*(eta2-eta1));
    double alpha = sin(eta2-eta1)*(sqrt(4+3*halfTan*halfTan)-1)/3;
    Point2 p1 = ellipticArcPoint(center, radius, axis, eta1);
    Point2 p2 = ellipticArcPoint(center, radius, axis, eta2);
    return BezierSegment(
        p1,
        p1+alpha*ellipticArcDerivative(radius, axis, eta1),
        p2-alpha*ellipticArcDerivative(radius, axis, eta2),
        p2
    );
}

GeometryStatus arcToBeziers(std::vector<BezierSegment> &output, Vector2 radius, double rotation, bool largeArc, bool sweep, Point2 startPoint, Point2 endPoint, double maxSegmentAngle) {
    if (!(startPoint.isFinite() && endPoint.isFinite() && radius.isFinite() && std::isfinite(rotation)))
        return GEOMETRY_DEGENERATE;
    if (!(maxSegmentAngle > 0 && std::isfinite(maxSegmentAngle)))
        return GEOMETRY_DEGENERATE;
    if (startPoint == endPoint)
        return GEOMETRY_DEGENERATE;
    radius.x = fabs(radius.x);
    radius.y = fabs(radius.y);
    if (radius.x == 0 || radius.y == 0)
        return GEOMETRY_DEGENERATE;

    // Endpoint half-difference in the ellipse's own coordinate system
    Vector2 axis(cos(rotation), sin(rotation));
    Vector2 rm = (.5*(startPoint-endPoint)).rotate(Vector2(axis.x, -axis.y));
    Vector2 rm2 = rm*rm;
    Vector2 radius2 = radius*radius;
    double radiusGap = rm2.x/radius2.x+rm2.y/radius2.y;
    double q = 0;
    bool enlarged = radiusGap > 1;
    if (enlarged) {
        // The enlarged ellipse passes through both endpoints with its center at their midpoint
        radius *= sqrt(radiusGap);
    } else {
        double dq = radius2.x*rm2.y+radius2.y*rm2.x;
        double pq = (radius2.x*radius2.y-dq)/dq;
        q = sqrt(max(pq, 0.));
        if (largeArc == sweep)
            q = -q;
    }
    Vector2 rc(q*radius.x*rm.y/radius.y, -q*radius.y*rm.x/radius.x);
    Point2 center = rc.rotate(axis)+.5*(startPoint+endPoint);

    double angleStart = arcAngle(Vector2(1, 0), (rm-rc)/radius);
    double angleExtent;
    if (enlarged)
        angleExtent = sweep ? M_PI : -M_PI;
    else {
        angleExtent = arcAngle((rm-rc)/radius, (-rm-rc)/radius);
        angleExtent -= 2*M_PI*floor(angleExtent/(2*M_PI));
        if (!sweep)
            angleExtent -= 2*M_PI;
    }
    double angleEnd = angleStart+angleExtent;

    double segmentRatio = (fabs(angleExtent)-ARC_ANGLE_EPSILON)/maxSegmentAngle;
    if (!(segmentRatio <= DMLGEOM_MAX_ARC_SEGMENTS))
        return GEOMETRY_DEGENERATE;
    int segmentCount = max((int) ceil(segmentRatio), 1);
    double step = angleExtent < 0 ? -maxSegmentAngle : maxSegmentAngle;

    std::vector<BezierSegment> segments;
    segments.reserve(segmentCount);
    double eta1 = angleStart;
    for (int i = 1; i <= segmentCount; ++i) {
        double eta2 = i == segmentCount ? angleEnd : angleStart+i*step;
        segments.push_back(ellipticArcSegment(center, radius, axis, eta1, eta2));
        eta1 = eta2;
    }

    for (std::vector<BezierSegment>::const_iterator segment = segments.begin(); segment != segments.end(); ++segment) {
        for (int i = 0; i < 4; ++i) {
            if (!segment->p[i].isFinite())
                return GEOMETRY_DEGENERATE;
        }
    }
    output.swap(segments);
    return GEOMETRY_OK;
}

GeometryStatus arcToBeziers(std::vector<BezierSegment> &output, const ArcParameters &arc, double maxSegmentAngle) {
    return arcToBeziers(output, arc.radius, arc.rotation, arc.largeArc, arc.sweep, arc.startPoint, arc.endPoint, maxSegmentAngle);
}

}
