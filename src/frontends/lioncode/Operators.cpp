//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Spelling and classification helpers for LionCode operators.
//
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Operators.hpp"

namespace lion::frontends::lioncode
{

const char *toString(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::And:
            return "and";
        case BinaryOp::Or:
            return "or";
        case BinaryOp::Shl:
            return "<<";
        case BinaryOp::Shr:
            return ">>";
    }
    return "?";
}

const char *toString(CompareOp op)
{
    switch (op)
    {
        case CompareOp::Eq:
            return "==";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
        case CompareOp::IsEqualTo:
            return "is equal to";
        case CompareOp::IsLessThan:
            return "is less than";
        case CompareOp::IsGreaterThan:
            return "is greater than";
    }
    return "?";
}

const char *toString(UnaryOp op)
{
    return op == UnaryOp::Neg ? "-" : "!";
}

CompareOp canonical(CompareOp op)
{
    switch (op)
    {
        case CompareOp::IsEqualTo:
            return CompareOp::Eq;
        case CompareOp::IsLessThan:
            return CompareOp::Lt;
        case CompareOp::IsGreaterThan:
            return CompareOp::Gt;
        default:
            return op;
    }
}

bool isEquality(CompareOp op)
{
    CompareOp c = canonical(op);
    return c == CompareOp::Eq || c == CompareOp::Ne;
}

} // namespace lion::frontends::lioncode
