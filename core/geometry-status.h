
#pragma once

namespace dmlgeom {

/// Result of a geometry computation. Every fallible operation returns one of these and writes its result through an output argument.
enum GeometryStatus {
    GEOMETRY_OK = 0,
    /// The first token of a formula does not name a known operation.
    GEOMETRY_UNKNOWN_FORMULA,
    /// A name is neither a preset constant nor a guide of the shape.
    GEOMETRY_UNRESOLVED_VARIABLE,
    /// A formula has a different number of operands than its operation takes.
    GEOMETRY_FORMULA_ARITY_MISMATCH,
    /// Guide resolution nested deeper than DMLGEOM_MAX_RESOLVE_DEPTH, usually a guide referring to itself.
    GEOMETRY_RECURSION_LIMIT,
    /// An arc cannot be constructed from its parameters, e.g. because of a zero radius.
    GEOMETRY_DEGENERATE,
    /// A path command is malformed (e.g. wrong number of points).
    GEOMETRY_INVALID_PATH
};

/// Returns a short human readable name of the status, for diagnostics.
const char *geometryStatusName(GeometryStatus status);

}
