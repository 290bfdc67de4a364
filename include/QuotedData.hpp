#pragma once

#include "SqlFragment.hpp"
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace sqlquote {

// A value rendered as a single-quoted SQL string literal.
//
// QuotedData never produces NULL or a bare numeric token: "42" renders as
// '42'. Callers that need those emit them themselves.
class QuotedData {
public:
    QuotedData() = default;
    explicit QuotedData(std::string value) : m_value(std::move(value)) {}
    explicit QuotedData(std::string_view value) : m_value(value) {}
    explicit QuotedData(const char* value) : m_value(value) {}

    // Original, unescaped value
    const std::string& str() const { return m_value; }

    // Escaped literal, e.g. 'O''Brien'
    std::string toString() const;

    // Literal whose payload is fn(value)
    QuotedData map(const std::function<std::string(std::string_view)>& fn) const;

    bool operator==(const QuotedData& other) const { return m_value == other.m_value; }
    bool operator!=(const QuotedData& other) const { return m_value != other.m_value; }
    bool operator<(const QuotedData& other) const { return m_value < other.m_value; }

private:
    std::string m_value;
};

std::ostream& operator<<(std::ostream& out, const QuotedData& data);

template<>
struct IsSqlFragment<QuotedData> : std::true_type {};

}  // namespace sqlquote
