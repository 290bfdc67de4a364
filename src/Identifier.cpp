#include "Identifier.hpp"

namespace sqlquote {

std::string Identifier::toString() const {
    return toString(IdentifierQuoting::WhenNeeded);
}

std::string Identifier::toString(IdentifierQuoting quoting) const {
    return SqlEscaper::formatIdentifier(m_name, quoting);
}

SchemaTable Table::withSchema(Schema schema) const {
    return SchemaTable(std::move(schema), *this);
}

SchemaTable Table::withSchema(std::string_view schema) const {
    return SchemaTable(Schema(schema), *this);
}

Table Table::withPostfix(std::string_view postfix) const {
    std::string name = str();
    name.append(postfix);
    return Table(std::move(name));
}

Table Table::withPostfixSep(std::string_view postfix, std::string_view separator) const {
    std::string name = str();
    name.append(separator);
    name.append(postfix);
    return Table(std::move(name));
}

std::string SchemaTable::toString() const {
    return toString(IdentifierQuoting::WhenNeeded);
}

std::string SchemaTable::toString(IdentifierQuoting quoting) const {
    std::string result = m_schema.toString(quoting);
    result += '.';
    result += m_table.toString(quoting);
    return result;
}

SchemaTable SchemaTable::withPostfix(std::string_view postfix) const {
    return SchemaTable(m_schema, m_table.withPostfix(postfix));
}

SchemaTable SchemaTable::withPostfixSep(std::string_view postfix,
                                        std::string_view separator) const {
    return SchemaTable(m_schema, m_table.withPostfixSep(postfix, separator));
}

QuotedData SchemaTable::asQuotedData() const {
    return QuotedData(m_schema.str() + "." + m_table.str());
}

std::ostream& operator<<(std::ostream& out, const Identifier& identifier) {
    return out << identifier.toString();
}

std::ostream& operator<<(std::ostream& out, const SchemaTable& table) {
    return out << table.toString();
}

}  // namespace sqlquote
