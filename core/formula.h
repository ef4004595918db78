
#pragma once

#include <string>
#include "geometry-status.h"

#define DMLGEOM_ANGLE_UNITS_PER_DEGREE 60000
#define DMLGEOM_MAX_FORMULA_OPERANDS 3

namespace dmlgeom {

/// Converts an angle given in 1/60000 of a degree to radians.
double radians(double angle);
/// Converts an angle in radians to 1/60000 of a degree.
double angleUnits(double radians);

/// The closed set of guide formula operations.
enum Operation {
    OP_MULTIPLY_DIVIDE, // */
    OP_ADD_SUBTRACT, // +-
    OP_ADD_DIVIDE, // +/
    OP_IF_ELSE, // ?:
    OP_ARC_TAN, // at2
    OP_TAN, // tan
    OP_COS_ARC_TAN, // cat2
    OP_COS, // cos
    OP_SIN_ARC_TAN, // sat2
    OP_SIN, // sin
    OP_MODULO, // mod
    OP_SQRT, // sqrt
    OP_VALUE, // val
    OP_ABS, // abs
    OP_MAX, // max
    OP_MIN, // min
    OP_PIN // pin
};

/// Finds the operation with the given name, returns false if there is none.
bool findOperation(Operation &operation, const std::string &name);
/// Returns the name of the operation as written in formulas.
const char *operationName(Operation operation);
/// Returns the number of operands the operation takes.
int operationArity(Operation operation);

/// A single formula token - either a numeric literal or a name to be resolved.
struct Token {
    enum Type {
        LITERAL,
        NAME
    } type;
    double value;
    std::string name;

    Token();
    static Token literal(double value);
    static Token named(const std::string &name);
    /// Classifies a whitespace-free token as a literal if it is entirely a number, otherwise as a name.
    static Token parse(const std::string &text);
};

/**
 * Parsed guide definition. A definition consisting of one token is a literal or a name,
 * several tokens form a formula whose first token selects the operation.
 * Malformed definitions are kept as INVALID and report their error when evaluated.
 */
struct Expression {
    enum Type {
        INVALID,
        TOKEN,
        FORMULA
    } type;
    /// The token of a TOKEN expression.
    Token token;
    /// The operation and operands of a FORMULA expression.
    Operation operation;
    Token operands[DMLGEOM_MAX_FORMULA_OPERANDS];
    int operandCount;
    /// The parse error of an INVALID expression.
    GeometryStatus error;

    Expression();
    static Expression parse(const std::string &definition);
};

/// Callback through which formula operands are turned into numbers.
class VariableResolver {

public:
    virtual ~VariableResolver() { }
    /// Resolves a token to a number. depth is the current nesting of guide resolution.
    virtual GeometryStatus resolve(double &output, const Token &token, int depth) const = 0;

};

/// Evaluates the expression. Operands are only resolved when the operation needs them.
GeometryStatus evaluateFormula(double &output, const Expression &expression, const VariableResolver &resolver, int depth = 0);
/// Parses and evaluates a whitespace delimited formula such as "*/ w 1.0 2.0".
GeometryStatus evaluateFormula(double &output, const std::string &expression, const VariableResolver &resolver);

}
