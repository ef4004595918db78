
#pragma once

/*
 * DRAWINGML SHAPE GEOMETRY v1.0
 * -----------------------------
 * Evaluates the guide formulas of presentation-document vector shape definitions
 * and reconstructs their paths as contours of lines and cubic Bezier curves.
 * Elliptical arcs are approximated by cubic segments spanning at most 45 degrees each.
 *
 */

#include "core/arithmetics.hpp"
#include "core/Vector2.hpp"
#include "core/geometry-status.h"
#include "core/formula.h"
#include "core/preset-constants.h"
#include "core/GeometryContext.h"
#include "core/arc-to-bezier.h"
#include "core/Shape.h"
#include "core/path-config.h"
#include "core/build-shape.h"
#include "core/export-svg.h"

#define DMLGEOM_VERSION "1.0"
