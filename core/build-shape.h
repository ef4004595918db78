
#pragma once

#include <string>
#include <vector>
#include "Shape.h"
#include "GeometryContext.h"
#include "path-config.h"

namespace dmlgeom {

/// A single command of a shape path. Numeric attributes are raw guide tokens or formulas, angles are in 1/60000 of a degree.
struct PathCommand {
    enum Type {
        /// Starts a new contour at points[0].
        MOVE_TO,
        /// Line to points[0].
        LINE_TO,
        /// Arc of the ellipse with radii (radiusX, radiusY) starting at the current point, which lies on the ellipse at startAngle, and swinging by swingAngle.
        ARC_TO,
        /// Arc to points[0] in SVG endpoint parameterization with radii, rotation, largeArc and sweep flags.
        ELLIPTICAL_ARC_TO,
        /// Quadratic curve with control point points[0] to points[1].
        QUAD_BEZ_TO,
        /// Cubic curve with control points points[0], points[1] to points[2].
        CUBIC_BEZ_TO,
        /// Closes the current contour.
        CLOSE
    } type;
    std::vector<RawPoint> points;
    std::string radiusX, radiusY;
    std::string startAngle, swingAngle;
    std::string rotation, largeArc, sweep;

    PathCommand();
    static PathCommand moveTo(const RawPoint &point);
    static PathCommand lineTo(const RawPoint &point);
    static PathCommand arcTo(const std::string &widthRadius, const std::string &heightRadius, const std::string &startAngle, const std::string &swingAngle);
    static PathCommand ellipticalArcTo(const std::string &radiusX, const std::string &radiusY, const std::string &rotation, const std::string &largeArc, const std::string &sweep, const RawPoint &point);
    static PathCommand quadBezTo(const RawPoint &control, const RawPoint &point);
    static PathCommand cubicBezTo(const RawPoint &control1, const RawPoint &control2, const RawPoint &point);
    static PathCommand close();
};

/// A path of a shape. Its coordinates are in a space of the given width and height, which is stretched to the shape's size. Zero means the shape's own size.
struct ShapePath {
    double width, height;
    std::vector<PathCommand> commands;

    inline ShapePath() : width(0), height(0) { }
};

/// Appends the contours of a single path to output. On failure, output is left unchanged.
GeometryStatus buildShapePath(Shape &output, const GeometryContext &context, const ShapePath &path, const PathConfig &config = PathConfig());

/// Replaces output with the geometry of all paths of a shape. On failure, output is left unchanged.
GeometryStatus buildShape(Shape &output, const GeometryContext &context, const std::vector<ShapePath> &paths, const PathConfig &config = PathConfig());

}
