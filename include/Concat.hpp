#pragma once

#include "SqlEscaper.hpp"
#include "SqlFragment.hpp"
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sqlquote {

class LiteralConcat;

// Several raw parts escaped together as one identifier:
// {"foo_", "bar", "_baz"} -> foo_bar_baz
// {"my ", "table"}        -> "my table"
class IdentifierConcat {
public:
    IdentifierConcat() = default;
    explicit IdentifierConcat(std::vector<std::string> parts) : m_parts(std::move(parts)) {}
    IdentifierConcat(std::initializer_list<std::string_view> parts);

    const std::vector<std::string>& parts() const { return m_parts; }

    // Concatenated raw value
    std::string str() const { return SqlEscaper::join(m_parts); }

    std::string toString() const;
    std::string toString(IdentifierQuoting quoting) const;

    // Same parts escaped as a string literal
    LiteralConcat asQuotedData() const;

private:
    std::vector<std::string> m_parts;
};

// Several raw parts escaped together as one string literal:
// {"it's", " ok"} -> 'it''s ok'
class LiteralConcat {
public:
    LiteralConcat() = default;
    explicit LiteralConcat(std::vector<std::string> parts) : m_parts(std::move(parts)) {}
    LiteralConcat(std::initializer_list<std::string_view> parts);

    const std::vector<std::string>& parts() const { return m_parts; }

    std::string str() const { return SqlEscaper::join(m_parts); }

    std::string toString() const;

private:
    std::vector<std::string> m_parts;
};

std::ostream& operator<<(std::ostream& out, const IdentifierConcat& concat);
std::ostream& operator<<(std::ostream& out, const LiteralConcat& concat);

template<> struct IsSqlFragment<IdentifierConcat> : std::true_type {};
template<> struct IsSqlFragment<LiteralConcat> : std::true_type {};

}  // namespace sqlquote
