#include <ostream>

#include "token.hpp"

#include "location.hpp"

auto token::operator==(const token& other) const -> bool
{
    return type == other.type && lexeme == other.lexeme && literal == other.literal && loc == other.loc;
}

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&
{
    ostream << "token{" << token.type << ", `" << token.lexeme << "´";
    if (token.literal) {
        ostream << ", " << token.literal->inspect();
    }
    return ostream << " " << token.loc << "}";
}
