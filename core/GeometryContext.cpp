
#include "GeometryContext.h"

#include "preset-constants.h"

namespace dmlgeom {

static Expression literalExpression(double value) {
    Expression expression;
    expression.type = Expression::TOKEN;
    expression.token = Token::literal(value);
    return expression;
}

GeometryContext::GeometryContext(double width, double height) : w(width), h(height) {
    guides["w"] = literalExpression(width);
    guides["h"] = literalExpression(height);
}

GeometryContext::GeometryContext(double width, double height, const std::vector<GuideDefinition> &adjustGuides, const std::vector<GuideDefinition> &shapeGuides) : w(width), h(height) {
    guides["w"] = literalExpression(width);
    guides["h"] = literalExpression(height);
    defineGuides(adjustGuides);
    defineGuides(shapeGuides);
}

void GeometryContext::defineGuides(const std::vector<GuideDefinition> &definitions) {
    for (std::vector<GuideDefinition>::const_iterator definition = definitions.begin(); definition != definitions.end(); ++definition)
        guides[definition->name] = Expression::parse(definition->formula);
}

GeometryStatus GeometryContext::value(double &output, const std::string &token) const {
    return evaluateFormula(output, Expression::parse(token), *this, 0);
}

GeometryStatus GeometryContext::point(Point2 &output, const RawPoint &rawPoint) const {
    Point2 result;
    GeometryStatus status = value(result.x, rawPoint.x);
    if (status != GEOMETRY_OK)
        return status;
    if ((status = value(result.y, rawPoint.y)) != GEOMETRY_OK)
        return status;
    output = result;
    return GEOMETRY_OK;
}

bool GeometryContext::hasGuide(const std::string &name) const {
    return guides.find(name) != guides.end();
}

GeometryStatus GeometryContext::resolve(double &output, const Token &token, int depth) const {
    if (depth > DMLGEOM_MAX_RESOLVE_DEPTH)
        return GEOMETRY_RECURSION_LIMIT;
    switch (token.type) {
        case Token::LITERAL:
            output = token.value;
            return GEOMETRY_OK;
        case Token::NAME:
            return resolveName(output, token.name, depth);
    }
    return GEOMETRY_UNRESOLVED_VARIABLE;
}

GeometryStatus GeometryContext::resolveName(double &output, const std::string &name, int depth) const {
    if (const Expression *preset = findPresetConstant(name))
        return evaluateFormula(output, *preset, *this, depth+1);
    std::map<std::string, Expression>::const_iterator guide = guides.find(name);
    if (guide != guides.end())
        return evaluateFormula(output, guide->second, *this, depth+1);
    // A lone operation name is a formula without operands
    Operation operation;
    if (findOperation(operation, name))
        return GEOMETRY_FORMULA_ARITY_MISMATCH;
    return GEOMETRY_UNRESOLVED_VARIABLE;
}

}
