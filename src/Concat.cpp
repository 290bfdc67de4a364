#include "Concat.hpp"

namespace sqlquote {

IdentifierConcat::IdentifierConcat(std::initializer_list<std::string_view> parts) {
    m_parts.reserve(parts.size());
    for (auto part : parts) {
        m_parts.emplace_back(part);
    }
}

std::string IdentifierConcat::toString() const {
    return toString(IdentifierQuoting::WhenNeeded);
}

std::string IdentifierConcat::toString(IdentifierQuoting quoting) const {
    return SqlEscaper::formatIdentifier(str(), quoting);
}

LiteralConcat IdentifierConcat::asQuotedData() const {
    return LiteralConcat(m_parts);
}

LiteralConcat::LiteralConcat(std::initializer_list<std::string_view> parts) {
    m_parts.reserve(parts.size());
    for (auto part : parts) {
        m_parts.emplace_back(part);
    }
}

std::string LiteralConcat::toString() const {
    std::string result;
    result += '\'';
    for (const auto& part : m_parts) {
        SqlEscaper::appendEscaped(result, part, '\'');
    }
    result += '\'';
    return result;
}

std::ostream& operator<<(std::ostream& out, const IdentifierConcat& concat) {
    return out << concat.toString();
}

std::ostream& operator<<(std::ostream& out, const LiteralConcat& concat) {
    return out << concat.toString();
}

}  // namespace sqlquote
