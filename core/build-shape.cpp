
#ifndef _USE_MATH_DEFINES
#define _USE_MATH_DEFINES
#endif
#include "build-shape.h"

#include <cstdio>
#include <cmath>
#include "arithmetics.hpp"

#define FULL_CIRCLE_ANGLE 21600000.
#define HALF_CIRCLE_ANGLE 10800000.

namespace dmlgeom {

#if defined(_DEBUG) || !defined(NDEBUG)
#define REQUIRE(cond) { if (!(cond)) { fprintf(stderr, "Shape Path Error (%s:%d): " #cond "\n", __FILE__, __LINE__); return GEOMETRY_INVALID_PATH; } }
#define REQUIRE_OK(expr) { GeometryStatus requiredStatus = (expr); if (requiredStatus != GEOMETRY_OK) { fprintf(stderr, "Shape Path Error (%s:%d): %s\n", __FILE__, __LINE__, geometryStatusName(requiredStatus)); return requiredStatus; } }
#else
#define REQUIRE(cond) { if (!(cond)) return GEOMETRY_INVALID_PATH; }
#define REQUIRE_OK(expr) { GeometryStatus requiredStatus = (expr); if (requiredStatus != GEOMETRY_OK) return requiredStatus; }
#endif

PathCommand::PathCommand() : type(CLOSE) { }

PathCommand PathCommand::moveTo(const RawPoint &point) {
    PathCommand command;
    command.type = MOVE_TO;
    command.points.push_back(point);
    return command;
}

PathCommand PathCommand::lineTo(const RawPoint &point) {
    PathCommand command;
    command.type = LINE_TO;
    command.points.push_back(point);
    return command;
}

PathCommand PathCommand::arcTo(const std::string &widthRadius, const std::string &heightRadius, const std::string &startAngle, const std::string &swingAngle) {
    PathCommand command;
    command.type = ARC_TO;
    command.radiusX = widthRadius;
    command.radiusY = heightRadius;
    command.startAngle = startAngle;
    command.swingAngle = swingAngle;
    return command;
}

PathCommand PathCommand::ellipticalArcTo(const std::string &radiusX, const std::string &radiusY, const std::string &rotation, const std::string &largeArc, const std::string &sweep, const RawPoint &point) {
    PathCommand command;
    command.type = ELLIPTICAL_ARC_TO;
    command.radiusX = radiusX;
    command.radiusY = radiusY;
    command.rotation = rotation;
    command.largeArc = largeArc;
    command.sweep = sweep;
    command.points.push_back(point);
    return command;
}

PathCommand PathCommand::quadBezTo(const RawPoint &control, const RawPoint &point) {
    PathCommand command;
    command.type = QUAD_BEZ_TO;
    command.points.push_back(control);
    command.points.push_back(point);
    return command;
}

PathCommand PathCommand::cubicBezTo(const RawPoint &control1, const RawPoint &control2, const RawPoint &point) {
    PathCommand command;
    command.type = CUBIC_BEZ_TO;
    command.points.push_back(control1);
    command.points.push_back(control2);
    command.points.push_back(point);
    return command;
}

PathCommand PathCommand::close() {
    return PathCommand();
}

/// Accumulates the contours of one path. Points are given in path space and stored in shape space.
class PathBuilder {

public:
    PathBuilder(Shape &shape, Vector2 scale) : shape(shape), scale(scale), contourIndex(-1) { }

    inline Point2 currentPoint() const {
        return prevNode;
    }

    void moveTo(Point2 node) {
        contourIndex = -1;
        startPoint = node;
        prevNode = node;
    }

    void lineTo(Point2 node) {
        contour().addEdge(EdgeHolder(scale*prevNode, scale*node));
        prevNode = node;
    }

    void cubicTo(Point2 control1, Point2 control2, Point2 node) {
        contour().addEdge(EdgeHolder(scale*prevNode, scale*control1, scale*control2, scale*node));
        prevNode = node;
    }

    GeometryStatus arcTo(Point2 node, Vector2 radius, double rotation, bool largeArc, bool sweep, double maxSegmentAngle) {
        if (node == prevNode)
            return GEOMETRY_OK;
        if (radius.x == 0 || radius.y == 0) {
            lineTo(node);
            return GEOMETRY_OK;
        }
        std::vector<BezierSegment> segments;
        REQUIRE_OK(arcToBeziers(segments, radius, rotation, largeArc, sweep, prevNode, node, maxSegmentAngle));
        segments.front().p[0] = prevNode;
        segments.back().p[3] = node;
        Contour &target = contour();
        for (std::vector<BezierSegment>::const_iterator segment = segments.begin(); segment != segments.end(); ++segment)
            target.addEdge(EdgeHolder(scale*segment->p[0], scale*segment->p[1], scale*segment->p[2], scale*segment->p[3]));
        prevNode = node;
        return GEOMETRY_OK;
    }

    void close(double endpointSnapRange) {
        if (contourIndex >= 0) {
            Contour &target = contour();
            if (!target.edges.empty() && prevNode != startPoint) {
                if ((prevNode-startPoint).length() < endpointSnapRange)
                    target.edges.back()->moveEndPoint(scale*startPoint);
                else
                    target.addEdge(EdgeHolder(scale*prevNode, scale*startPoint));
            }
            target.closed = true;
        }
        contourIndex = -1;
        prevNode = startPoint;
    }

private:
    Shape &shape;
    Vector2 scale;
    int contourIndex;
    Point2 startPoint;
    Point2 prevNode;

    Contour &contour() {
        if (contourIndex < 0) {
            contourIndex = (int) shape.contours.size();
            shape.addContour();
        }
        return shape.contours[contourIndex];
    }

};

// Parameter of the ellipse point which is seen from its center at the given angle
static double ellipseParameter(Vector2 radius, double angle) {
    return atan2(radius.x*sin(angle), radius.y*cos(angle));
}

static GeometryStatus addDrawingArc(PathBuilder &builder, Vector2 radius, double startAngle, double swingAngle, double maxSegmentAngle) {
    if (swingAngle == 0)
        return GEOMETRY_OK;
    radius.x = fabs(radius.x);
    radius.y = fabs(radius.y);
    swingAngle = clamp(swingAngle, -FULL_CIRCLE_ANGLE, FULL_CIRCLE_ANGLE);
    Point2 startPoint = builder.currentPoint();
    double t = ellipseParameter(radius, radians(startAngle));
    Point2 center = startPoint-radius*Vector2(cos(t), sin(t));
    // Each piece spans at most half of the ellipse, so the smaller arc is always the one wanted
    int pieces = fabs(swingAngle) > HALF_CIRCLE_ANGLE ? 2 : 1;
    for (int i = 1; i <= pieces; ++i) {
        Point2 node;
        if (i == pieces && fabs(swingAngle) == FULL_CIRCLE_ANGLE)
            node = startPoint;
        else {
            t = ellipseParameter(radius, radians(startAngle+swingAngle*i/pieces));
            node = center+radius*Vector2(cos(t), sin(t));
        }
        REQUIRE_OK(builder.arcTo(node, radius, 0, false, swingAngle > 0, maxSegmentAngle));
    }
    return GEOMETRY_OK;
}

static GeometryStatus resolvePoints(Point2 *output, const GeometryContext &context, const PathCommand &command, size_t count) {
    REQUIRE(command.points.size() == count);
    for (size_t i = 0; i < count; ++i)
        REQUIRE_OK(context.point(output[i], command.points[i]));
    return GEOMETRY_OK;
}

static GeometryStatus addCommand(PathBuilder &builder, const GeometryContext &context, const PathCommand &command, const PathConfig &config) {
    Point2 points[3];
    switch (command.type) {
        case PathCommand::MOVE_TO:
            REQUIRE_OK(resolvePoints(points, context, command, 1));
            builder.moveTo(points[0]);
            break;
        case PathCommand::LINE_TO:
            REQUIRE_OK(resolvePoints(points, context, command, 1));
            builder.lineTo(points[0]);
            break;
        case PathCommand::ARC_TO:
            {
                Vector2 radius;
                double startAngle, swingAngle;
                REQUIRE_OK(context.value(radius.x, command.radiusX));
                REQUIRE_OK(context.value(radius.y, command.radiusY));
                REQUIRE_OK(context.value(startAngle, command.startAngle));
                REQUIRE_OK(context.value(swingAngle, command.swingAngle));
                REQUIRE_OK(addDrawingArc(builder, radius, startAngle, swingAngle, config.arcSegmentAngle));
            }
            break;
        case PathCommand::ELLIPTICAL_ARC_TO:
            {
                Vector2 radius;
                double rotation, largeArc, sweep;
                REQUIRE_OK(context.value(radius.x, command.radiusX));
                REQUIRE_OK(context.value(radius.y, command.radiusY));
                REQUIRE_OK(context.value(rotation, command.rotation));
                REQUIRE_OK(context.value(largeArc, command.largeArc));
                REQUIRE_OK(context.value(sweep, command.sweep));
                REQUIRE_OK(resolvePoints(points, context, command, 1));
                REQUIRE_OK(builder.arcTo(points[0], radius, radians(rotation), largeArc != 0, sweep != 0, config.arcSegmentAngle));
            }
            break;
        case PathCommand::QUAD_BEZ_TO:
            {
                REQUIRE_OK(resolvePoints(points, context, command, 2));
                // Exact degree elevation
                Point2 start = builder.currentPoint();
                builder.cubicTo(mix(start, points[0], 2/3.), mix(points[0], points[1], 1/3.), points[1]);
            }
            break;
        case PathCommand::CUBIC_BEZ_TO:
            REQUIRE_OK(resolvePoints(points, context, command, 3));
            builder.cubicTo(points[0], points[1], points[2]);
            break;
        case PathCommand::CLOSE:
            builder.close(config.endpointSnapRange);
            break;
        default:
            REQUIRE(!"Unknown path command");
    }
    return GEOMETRY_OK;
}

GeometryStatus buildShapePath(Shape &output, const GeometryContext &context, const ShapePath &path, const PathConfig &config) {
    Vector2 scale(1, 1);
    if (path.width > 0)
        scale.x = context.width()/path.width;
    if (path.height > 0)
        scale.y = context.height()/path.height;
    Shape shape;
    PathBuilder builder(shape, scale);
    for (std::vector<PathCommand>::const_iterator command = path.commands.begin(); command != path.commands.end(); ++command)
        REQUIRE_OK(addCommand(builder, context, *command, config));
    for (std::vector<Contour>::iterator contour = shape.contours.begin(); contour != shape.contours.end(); ++contour)
        output.addContour((Contour &&) *contour);
    return GEOMETRY_OK;
}

GeometryStatus buildShape(Shape &output, const GeometryContext &context, const std::vector<ShapePath> &paths, const PathConfig &config) {
    Shape shape;
    for (std::vector<ShapePath>::const_iterator path = paths.begin(); path != paths.end(); ++path)
        REQUIRE_OK(buildShapePath(shape, context, *path, config));
    output.contours.swap(shape.contours);
    return GEOMETRY_OK;
}

}
