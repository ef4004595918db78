
#pragma once

#include <map>
#include <string>
#include <vector>
#include "Vector2.hpp"
#include "formula.h"

// Maximum nesting of preset and guide references before resolution is aborted.
#ifndef DMLGEOM_MAX_RESOLVE_DEPTH
#define DMLGEOM_MAX_RESOLVE_DEPTH 64
#endif

namespace dmlgeom {

/// A named shape guide and its unparsed formula or literal.
struct GuideDefinition {
    std::string name;
    std::string formula;

    inline GuideDefinition() { }
    inline GuideDefinition(const std::string &name, const std::string &formula) : name(name), formula(formula) { }
};

/// A path point as raw x and y attribute strings.
struct RawPoint {
    std::string x, y;

    inline RawPoint() { }
    inline RawPoint(const std::string &x, const std::string &y) : x(x), y(y) { }
};

/**
 * The variables of a single shape: its width w, height h, and guides.
 * A token is resolved as a literal number, then as a preset constant, then as a guide,
 * and finally as a formula. Nothing is cached, each query walks the definitions again.
 */
class GeometryContext : public VariableResolver {

public:
    GeometryContext(double width, double height);
    /// Adjustable guides are defined first, then the rest. A later definition of the same name replaces the earlier one.
    GeometryContext(double width, double height, const std::vector<GuideDefinition> &adjustGuides, const std::vector<GuideDefinition> &guides);

    /// Resolves a token or formula to a number.
    GeometryStatus value(double &output, const std::string &token) const;
    /// Resolves the coordinates of a path point.
    GeometryStatus point(Point2 &output, const RawPoint &rawPoint) const;
    /// Returns true if the shape defines a guide (or w / h) of the given name.
    bool hasGuide(const std::string &name) const;

    inline double width() const { return w; }
    inline double height() const { return h; }

    virtual GeometryStatus resolve(double &output, const Token &token, int depth) const;

private:
    double w, h;
    std::map<std::string, Expression> guides;

    void defineGuides(const std::vector<GuideDefinition> &definitions);
    GeometryStatus resolveName(double &output, const std::string &name, int depth) const;

};

}
