
#include "geometry-status.h"

namespace dmlgeom {

const char *geometryStatusName(GeometryStatus status) {
    switch (status) {
        case GEOMETRY_OK:
            return "ok";
        case GEOMETRY_UNKNOWN_FORMULA:
            return "unknown formula";
        case GEOMETRY_UNRESOLVED_VARIABLE:
            return "unresolved variable";
        case GEOMETRY_FORMULA_ARITY_MISMATCH:
            return "formula arity mismatch";
        case GEOMETRY_RECURSION_LIMIT:
            return "recursion limit exceeded";
        case GEOMETRY_DEGENERATE:
            return "degenerate geometry";
        case GEOMETRY_INVALID_PATH:
            return "invalid path";
    }
    return "unknown status";
}

}
