#include "lexpp/AST.h"

namespace lexpp {

const char *kindName(ArithKind k) {
    switch (k) {
    case ArithKind::Int:   return "Int";
    case ArithKind::Ident: return "Ident";
    case ArithKind::Neg:   return "Neg";
    case ArithKind::Add:   return "Add";
    case ArithKind::Sub:   return "Sub";
    case ArithKind::Mul:   return "Mul";
    case ArithKind::Div:   return "Div";
    case ArithKind::Mod:   return "Mod";
    case ArithKind::Lnot:  return "Lnot";
    case ArithKind::Lsl:   return "Lsl";
    case ArithKind::Lsr:   return "Lsr";
    case ArithKind::Asr:   return "Asr";
    case ArithKind::Land:  return "Land";
    case ArithKind::Lor:   return "Lor";
    case ArithKind::Lxor:  return "Lxor";
    }
    return "?";
}

const char *kindName(BoolKind k) {
    switch (k) {
    case BoolKind::True:    return "True";
    case BoolKind::False:   return "False";
    case BoolKind::Defined: return "Defined";
    case BoolKind::Not:     return "Not";
    case BoolKind::And:     return "And";
    case BoolKind::Or:      return "Or";
    case BoolKind::Eq:      return "Eq";
    case BoolKind::Lt:      return "Lt";
    case BoolKind::Gt:      return "Gt";
    }
    return "?";
}

const char *kindName(NodeKind k) {
    switch (k) {
    case NodeKind::Ident:       return "Ident";
    case NodeKind::Def:         return "Def";
    case NodeKind::Defun:       return "Defun";
    case NodeKind::Undef:       return "Undef";
    case NodeKind::Include:     return "Include";
    case NodeKind::Cond:        return "Cond";
    case NodeKind::Error:       return "Error";
    case NodeKind::Warning:     return "Warning";
    case NodeKind::Text:        return "Text";
    case NodeKind::Seq:         return "Seq";
    case NodeKind::Line:        return "Line";
    case NodeKind::CurrentLine: return "CurrentLine";
    case NodeKind::CurrentFile: return "CurrentFile";
    }
    return "?";
}

} // namespace lexpp
