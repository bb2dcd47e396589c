#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case eof:
            return ostream << "eof";
        case lparen:
            return ostream << "(";
        case rparen:
            return ostream << ")";
        case lsquirly:
            return ostream << "{";
        case rsquirly:
            return ostream << "}";
        case comma:
            return ostream << ",";
        case dot:
            return ostream << ".";
        case minus:
            return ostream << "-";
        case plus:
            return ostream << "+";
        case semicolon:
            return ostream << ";";
        case asterisk:
            return ostream << "*";
        case slash:
            return ostream << "/";
        case exclamation:
            return ostream << "!";
        case not_equals:
            return ostream << "!=";
        case assign:
            return ostream << "=";
        case equals:
            return ostream << "==";
        case less_than:
            return ostream << "<";
        case less_equal:
            return ostream << "<=";
        case greater_than:
            return ostream << ">";
        case greater_equal:
            return ostream << ">=";
        case ident:
            return ostream << "identifier";
        case string:
            return ostream << "string";
        case number:
            return ostream << "number";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case nil:
            return ostream << "nil";
        case var:
            return ostream << "var";
        case print:
            return ostream << "print";
    }
    throw std::invalid_argument("invalid token_type");
}
