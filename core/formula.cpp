
#ifndef _USE_MATH_DEFINES
#define _USE_MATH_DEFINES
#endif
#include "formula.h"

#include <cmath>
#include <cstdlib>
#include <vector>
#include "arithmetics.hpp"

namespace dmlgeom {

struct OperationDescriptor {
    const char *name;
    Operation operation;
    int arity;
};

static const OperationDescriptor OPERATIONS[] = {
    { "*/", OP_MULTIPLY_DIVIDE, 3 },
    { "+-", OP_ADD_SUBTRACT, 3 },
    { "+/", OP_ADD_DIVIDE, 3 },
    { "?:", OP_IF_ELSE, 3 },
    { "at2", OP_ARC_TAN, 2 },
    { "tan", OP_TAN, 2 },
    { "cat2", OP_COS_ARC_TAN, 3 },
    { "cos", OP_COS, 2 },
    { "sat2", OP_SIN_ARC_TAN, 3 },
    { "sin", OP_SIN, 2 },
    { "mod", OP_MODULO, 3 },
    { "sqrt", OP_SQRT, 1 },
    { "val", OP_VALUE, 1 },
    { "abs", OP_ABS, 1 },
    { "max", OP_MAX, 2 },
    { "min", OP_MIN, 2 },
    { "pin", OP_PIN, 3 }
};

#define OPERATION_COUNT (sizeof(OPERATIONS)/sizeof(*OPERATIONS))

double radians(double angle) {
    return angle*M_PI/(DMLGEOM_ANGLE_UNITS_PER_DEGREE*180.);
}

double angleUnits(double radians) {
    return radians*DMLGEOM_ANGLE_UNITS_PER_DEGREE*180./M_PI;
}

bool findOperation(Operation &operation, const std::string &name) {
    for (size_t i = 0; i < OPERATION_COUNT; ++i) {
        if (name == OPERATIONS[i].name) {
            operation = OPERATIONS[i].operation;
            return true;
        }
    }
    return false;
}

const char *operationName(Operation operation) {
    return OPERATIONS[operation].name;
}

int operationArity(Operation operation) {
    return OPERATIONS[operation].arity;
}

static bool parseDouble(double &value, const char *arg) {
    // Only decimal notation is numeric, so hexadecimal-looking tokens remain names
    const char *digits = arg+(*arg == '+' || *arg == '-');
    if (digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
        return false;
    char *end = NULL;
    value = strtod(arg, &end);
    return end > arg && !*end;
}

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static void splitTokens(std::vector<std::string> &tokens, const std::string &text) {
    const char *cur = text.c_str();
    while (*cur) {
        while (isSpace(*cur))
            ++cur;
        const char *start = cur;
        while (*cur && !isSpace(*cur))
            ++cur;
        if (cur > start)
            tokens.push_back(std::string(start, cur));
    }
}

Token::Token() : type(LITERAL), value(0) { }

Token Token::literal(double value) {
    Token token;
    token.type = LITERAL;
    token.value = value;
    return token;
}

Token Token::named(const std::string &name) {
    Token token;
    token.type = NAME;
    token.name = name;
    return token;
}

Token Token::parse(const std::string &text) {
    double value;
    if (parseDouble(value, text.c_str()))
        return literal(value);
    return named(text);
}

Expression::Expression() : type(INVALID), operation(OP_VALUE), operandCount(0), error(GEOMETRY_UNRESOLVED_VARIABLE) { }

Expression Expression::parse(const std::string &definition) {
    Expression expression;
    std::vector<std::string> tokens;
    splitTokens(tokens, definition);
    if (tokens.empty())
        return expression;
    if (tokens.size() == 1) {
        expression.type = TOKEN;
        expression.token = Token::parse(tokens[0]);
        return expression;
    }
    Operation operation;
    if (!findOperation(operation, tokens[0])) {
        expression.error = GEOMETRY_UNKNOWN_FORMULA;
        return expression;
    }
    if ((int) tokens.size()-1 != operationArity(operation)) {
        expression.error = GEOMETRY_FORMULA_ARITY_MISMATCH;
        return expression;
    }
    expression.type = FORMULA;
    expression.operation = operation;
    expression.operandCount = (int) tokens.size()-1;
    for (int i = 0; i < expression.operandCount; ++i)
        expression.operands[i] = Token::parse(tokens[i+1]);
    return expression;
}

#define RESOLVE_OPERAND(output, index) { \
    GeometryStatus operandStatus = resolver.resolve(output, expression.operands[index], depth); \
    if (operandStatus != GEOMETRY_OK) \
        return operandStatus; \
}

GeometryStatus evaluateFormula(double &output, const Expression &expression, const VariableResolver &resolver, int depth) {
    switch (expression.type) {
        case Expression::INVALID:
            return expression.error;
        case Expression::TOKEN:
            return resolver.resolve(output, expression.token, depth);
        case Expression::FORMULA:
            break;
    }

    double x = 0, y = 0, z = 0;
    switch (expression.operation) {
        case OP_MULTIPLY_DIVIDE:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            RESOLVE_OPERAND(z, 2);
            output = x*y/z;
            break;
        case OP_ADD_SUBTRACT:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            RESOLVE_OPERAND(z, 2);
            output = x+y-z;
            break;
        case OP_ADD_DIVIDE:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            RESOLVE_OPERAND(z, 2);
            output = (x+y)/z;
            break;
        case OP_IF_ELSE:
            RESOLVE_OPERAND(x, 0);
            if (x > 0) {
                RESOLVE_OPERAND(output, 1);
            } else {
                RESOLVE_OPERAND(output, 2);
            }
            break;
        case OP_ARC_TAN:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            if (x != 0)
                output = angleUnits(atan(y/x));
            else
                return resolver.resolve(output, Token::named(y >= 0 ? "cd4" : "3cd4"), depth);
            break;
        case OP_TAN:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            output = x*tan(radians(y));
            break;
        case OP_COS_ARC_TAN:
            RESOLVE_OPERAND(y, 1);
            if (y != 0) {
                RESOLVE_OPERAND(x, 0);
                RESOLVE_OPERAND(z, 2);
                output = x*cos(atan(z/y));
            } else
                output = 0;
            break;
        case OP_COS:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            output = x*cos(radians(y));
            break;
        case OP_SIN_ARC_TAN:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            RESOLVE_OPERAND(z, 2);
            if (y != 0)
                output = x*sin(atan(z/y));
            else
                output = z >= 0 ? x : -x;
            break;
        case OP_SIN:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            output = x*sin(radians(y));
            break;
        case OP_MODULO:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            RESOLVE_OPERAND(z, 2);
            output = sqrt(x*x+y*y+z*z);
            break;
        case OP_SQRT:
            RESOLVE_OPERAND(x, 0);
            output = sqrt(x);
            break;
        case OP_VALUE:
            RESOLVE_OPERAND(output, 0);
            break;
        case OP_ABS:
            RESOLVE_OPERAND(x, 0);
            output = fabs(x);
            break;
        case OP_MAX:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            output = max(x, y);
            break;
        case OP_MIN:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            output = min(x, y);
            break;
        case OP_PIN:
            RESOLVE_OPERAND(x, 0);
            RESOLVE_OPERAND(y, 1);
            if (y < x)
                output = x;
            else {
                RESOLVE_OPERAND(z, 2);
                output = y > z ? z : y;
            }
            break;
    }
    return GEOMETRY_OK;
}

GeometryStatus evaluateFormula(double &output, const std::string &expression, const VariableResolver &resolver) {
    return evaluateFormula(output, Expression::parse(expression), resolver, 0);
}

}
