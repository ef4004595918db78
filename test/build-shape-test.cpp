/**
 * @file Tests of shape path construction from guide-based path commands.
 */
#ifndef _USE_MATH_DEFINES
#define _USE_MATH_DEFINES
#endif
#include "core/build-shape.h"
#include "core/export-svg.h"

#include <cmath>
#include <string>
#include <vector>
#include <gtest/gtest.h>

using namespace dmlgeom;

#define EXPECT_POINT_NEAR(a, b, tolerance) \
    { \
        EXPECT_NEAR((a).x, (b).x, tolerance); \
        EXPECT_NEAR((a).y, (b).y, tolerance); \
    }

static int countEdges(const Contour &contour, int edgeType)
{
    int count = 0;
    for (size_t i = 0; i < contour.edges.size(); ++i)
        count += contour.edges[i]->type() == edgeType;
    return count;
}

// The ellipse preset: four quarter arcs around the bounding box
static ShapePath ellipsePath()
{
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("l", "vc")));
    path.commands.push_back(PathCommand::arcTo("wd2", "hd2", "cd2", "cd4"));
    path.commands.push_back(PathCommand::arcTo("wd2", "hd2", "3cd4", "cd4"));
    path.commands.push_back(PathCommand::arcTo("wd2", "hd2", "0", "cd4"));
    path.commands.push_back(PathCommand::arcTo("wd2", "hd2", "cd4", "cd4"));
    path.commands.push_back(PathCommand::close());
    return path;
}

TEST(BuildShapeTest, rectangle)
{
    GeometryContext context(40, 20);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("l", "t")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("r", "t")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("r", "b")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("l", "b")));
    path.commands.push_back(PathCommand::close());

    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.contours.size(), 1u);
    EXPECT_TRUE(shape.contours[0].closed);
    EXPECT_EQ(shape.edgeCount(), 4);
    EXPECT_TRUE(shape.validate());

    std::string svg;
    shapeToSvgPathData(svg, shape);
    EXPECT_EQ(svg, "M 0 0 L 40 0 L 40 20 L 0 20 L 0 0 Z");
}

TEST(BuildShapeTest, ellipseFromQuarterArcs)
{
    GeometryContext context(200, 100);
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, ellipsePath())), GEOMETRY_OK);
    ASSERT_EQ(shape.contours.size(), 1u);
    const Contour &contour = shape.contours[0];
    EXPECT_EQ(contour.edges.size(), 8u);
    EXPECT_EQ(countEdges(contour, CubicSegment::EDGE_TYPE), 8);
    EXPECT_TRUE(shape.validate());

    EXPECT_EQ(contour.edges[0]->point(0), Point2(0, 50));
    EXPECT_POINT_NEAR(contour.edges[1]->point(1), Point2(100, 0), 1e-9);
    EXPECT_POINT_NEAR(contour.edges[3]->point(1), Point2(200, 50), 1e-9);
    EXPECT_POINT_NEAR(contour.edges[5]->point(1), Point2(100, 100), 1e-9);

    Shape::Bounds bounds = shape.getBounds();
    EXPECT_NEAR(bounds.l, 0, 1e-3);
    EXPECT_NEAR(bounds.b, 0, 1e-3);
    EXPECT_NEAR(bounds.r, 200, 1e-3);
    EXPECT_NEAR(bounds.t, 100, 1e-3);
}

TEST(BuildShapeTest, fullCircleArcReturnsToStart)
{
    GeometryContext context(100, 100);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("r", "vc")));
    path.commands.push_back(PathCommand::arcTo("wd2", "hd2", "0", "21600000"));
    path.commands.push_back(PathCommand::close());
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.contours.size(), 1u);
    EXPECT_EQ(shape.contours[0].edges.size(), 8u);
    EXPECT_EQ(shape.contours[0].edges.back()->point(1), Point2(100, 50));
    EXPECT_TRUE(shape.validate());
    // Half way round, the circle passes the left edge
    EXPECT_POINT_NEAR(shape.contours[0].edges[3]->point(1), Point2(0, 50), 1e-9);
}

TEST(BuildShapeTest, negativeSwingRunsCounterClockwise)
{
    GeometryContext context(100, 100);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("r", "vc")));
    path.commands.push_back(PathCommand::arcTo("wd2", "hd2", "0", "-5400000"));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.edgeCount(), 2);
    EXPECT_POINT_NEAR(shape.contours[0].edges[1]->point(1), Point2(50, 0), 1e-9);
    EXPECT_FALSE(shape.contours[0].closed);
}

TEST(BuildShapeTest, ellipticalArcCommand)
{
    GeometryContext context(100, 100);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::ellipticalArcTo("wd2", "wd2", "0", "0", "1", RawPoint("r", "0")));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.edgeCount(), 4);
    EXPECT_EQ(shape.contours[0].edges.back()->point(1), Point2(100, 0));
    EXPECT_POINT_NEAR(shape.contours[0].edges[1]->point(1), Point2(50, -50), 1e-9);
}

TEST(BuildShapeTest, degenerateEllipticalArcs)
{
    GeometryContext context(100, 100);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    // Same point - nothing is added
    path.commands.push_back(PathCommand::ellipticalArcTo("10", "10", "0", "0", "1", RawPoint("0", "0")));
    // Zero radius - straight line
    path.commands.push_back(PathCommand::ellipticalArcTo("0", "10", "0", "0", "1", RawPoint("50", "0")));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.edgeCount(), 1);
    EXPECT_EQ(shape.contours[0].edges[0]->type(), (int) LinearSegment::EDGE_TYPE);
}

TEST(BuildShapeTest, quadraticCurveIsElevatedExactly)
{
    GeometryContext context(100, 100);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::quadBezTo(RawPoint("hc", "b"), RawPoint("r", "t")));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.edgeCount(), 1);
    const EdgeHolder &edge = shape.contours[0].edges[0];
    ASSERT_EQ(edge->type(), (int) CubicSegment::EDGE_TYPE);
    for (int i = 0; i <= 4; ++i) {
        double t = .25*i;
        Point2 quadratic = (1-t)*(1-t)*Point2(0, 0)+2*t*(1-t)*Point2(50, 100)+t*t*Point2(100, 0);
        EXPECT_POINT_NEAR(edge->point(t), quadratic, 1e-12);
    }
}

TEST(BuildShapeTest, cubicCurveKeepsControlPoints)
{
    GeometryContext context(100, 100);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::cubicBezTo(RawPoint("0", "0"), RawPoint("r", "b"), RawPoint("r", "b")));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    const Point2 *p = shape.contours[0].edges[0]->controlPoints();
    EXPECT_EQ(p[1], Point2(0, 0));
    EXPECT_EQ(p[2], Point2(100, 100));
}

TEST(BuildShapeTest, pathSpaceIsStretchedToShape)
{
    GeometryContext context(200, 50);
    ShapePath path;
    path.width = 100;
    path.height = 100;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("100", "100")));
    path.commands.push_back(PathCommand::arcTo("50", "50", "cd2", "cd2"));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    ASSERT_EQ(shape.contours.size(), 1u);
    EXPECT_EQ(shape.contours[0].edges[0]->point(1), Point2(200, 50));
    // Half circle of radius 50 centered at (150, 100) in path space ends at (200, 100)
    EXPECT_POINT_NEAR(shape.contours[0].edges.back()->point(1), Point2(400, 50), 1e-9);
    EXPECT_TRUE(shape.validate());
}

TEST(BuildShapeTest, moveToStartsNewContour)
{
    GeometryContext context(10, 10);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("10", "0")));
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "5")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("10", "5")));
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "10")));
    std::vector<ShapePath> paths(1, path);
    paths.push_back(ellipsePath());
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, paths), GEOMETRY_OK);
    EXPECT_EQ(shape.contours.size(), 3u);
    EXPECT_FALSE(shape.contours[0].closed);
    EXPECT_TRUE(shape.contours[2].closed);
    EXPECT_EQ(shape.edgeCount(), 10);
}

TEST(BuildShapeTest, closeSnapsNearbyEnd)
{
    GeometryContext context(10, 10);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("10", "0")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("0.0001", "0")));
    path.commands.push_back(PathCommand::close());
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path), PathConfig(DMLGEOM_DEFAULT_ARC_SEGMENT_ANGLE, .001)), GEOMETRY_OK);
    EXPECT_EQ(shape.edgeCount(), 2);
    EXPECT_EQ(shape.contours[0].edges.back()->point(1), Point2(0, 0));

    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, path)), GEOMETRY_OK);
    EXPECT_EQ(shape.edgeCount(), 3);
}

TEST(BuildShapeTest, configuredArcSegmentAngle)
{
    GeometryContext context(200, 100);
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, ellipsePath()), PathConfig(M_PI/2)), GEOMETRY_OK);
    EXPECT_EQ(shape.edgeCount(), 4);
}

TEST(BuildShapeTest, tinyArcSegmentAngleIsRejected)
{
    GeometryContext context(200, 100);
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, ellipsePath())), GEOMETRY_OK);
    EXPECT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, ellipsePath()), PathConfig(1e-20)), GEOMETRY_DEGENERATE);
    EXPECT_EQ(shape.edgeCount(), 8);
}

TEST(BuildShapeTest, failureLeavesShapeUntouched)
{
    GeometryContext context(10, 10);
    ShapePath path;
    path.commands.push_back(PathCommand::moveTo(RawPoint("0", "0")));
    path.commands.push_back(PathCommand::lineTo(RawPoint("10", "missing")));
    Shape shape;
    ASSERT_EQ(buildShape(shape, context, std::vector<ShapePath>(1, ellipsePath())), GEOMETRY_OK);
    std::vector<ShapePath> paths(1, ellipsePath());
    paths.push_back(path);
    EXPECT_EQ(buildShape(shape, context, paths), GEOMETRY_UNRESOLVED_VARIABLE);
    EXPECT_EQ(shape.edgeCount(), 8);
    EXPECT_EQ(buildShapePath(shape, context, path), GEOMETRY_UNRESOLVED_VARIABLE);
    EXPECT_EQ(shape.contours.size(), 1u);
}

TEST(BuildShapeTest, errorsAreReported)
{
    GeometryContext context(10, 10);
    Shape shape;

    ShapePath wrongPointCount;
    PathCommand line = PathCommand::lineTo(RawPoint("0", "0"));
    line.points.push_back(RawPoint("1", "1"));
    wrongPointCount.commands.push_back(line);
    EXPECT_EQ(buildShapePath(shape, context, wrongPointCount), GEOMETRY_INVALID_PATH);

    ShapePath unknownFormula;
    unknownFormula.commands.push_back(PathCommand::arcTo("wd2", "hd2", "0", "foo 1 2"));
    EXPECT_EQ(buildShapePath(shape, context, unknownFormula), GEOMETRY_UNKNOWN_FORMULA);

    ShapePath nonFiniteArc;
    nonFiniteArc.commands.push_back(PathCommand::ellipticalArcTo("10", "10", "0", "0", "1", RawPoint("*/ 1 1 0", "0")));
    EXPECT_EQ(buildShapePath(shape, context, nonFiniteArc), GEOMETRY_DEGENERATE);
    EXPECT_TRUE(shape.contours.empty());
}
