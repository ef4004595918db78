
#pragma once

#include "arc-to-bezier.h"

#define DMLGEOM_DEFAULT_ENDPOINT_SNAP_RANGE 1e-9

namespace dmlgeom {

/// The configuration of shape path construction.
struct PathConfig {
    /// The largest angle of the ellipse parameter covered by a single cubic segment of an arc.
    double arcSegmentAngle;
    /// When a contour is closed and its end is closer to its start than this, the last edge is moved instead of adding a closing line.
    double endpointSnapRange;

    inline explicit PathConfig(double arcSegmentAngle = DMLGEOM_DEFAULT_ARC_SEGMENT_ANGLE, double endpointSnapRange = DMLGEOM_DEFAULT_ENDPOINT_SNAP_RANGE) : arcSegmentAngle(arcSegmentAngle), endpointSnapRange(endpointSnapRange) { }
};

}
