#pragma once

#include "SqlFragment.hpp"
#include <fmt/format.h>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace sqlquote {

// SQL keyword followed by predicates joined with AND, one per line:
//   WHERE a = 'x'
//   AND b
// Renders as an empty string when there are no predicates.
class PredicateStatement {
public:
    PredicateStatement(std::string keyword, std::vector<std::string> predicates)
        : m_keyword(std::move(keyword)), m_predicates(std::move(predicates)) {}

    std::string toString() const;

private:
    std::string m_keyword;
    std::vector<std::string> m_predicates;
};

/**
 * @class Predicates
 * @brief Ordered collection of boolean predicates combined with AND.
 *
 * A predicate is anything fmt can format: a plain string, a typed fragment
 * or a pre-built comparison. It is rendered when added, so the collection
 * holds no references to the caller's values.
 *
 *     auto where = Predicates::from(fmt::format("{} = {}", Column("name"), QuotedData("x")))
 *                      .andAlso("active")
 *                      .asWhere();
 */
class Predicates {
public:
    using value_type = std::string;
    using const_iterator = std::vector<std::string>::const_iterator;

    Predicates() = default;

    template<typename P>
    static Predicates from(P&& predicate) {
        return Predicates().andAlso(std::forward<P>(predicate));
    }

    template<typename Range>
    static Predicates fromAll(const Range& predicates) {
        return Predicates().andAll(predicates);
    }

    template<typename P>
    void andPush(P&& predicate) {
        m_predicates.push_back(fmt::format("{}", std::forward<P>(predicate)));
    }

    template<typename Range>
    void andExtend(const Range& predicates) {
        for (const auto& predicate : predicates) {
            andPush(predicate);
        }
    }

    template<typename P>
    Predicates& andAlso(P&& predicate) & {
        andPush(std::forward<P>(predicate));
        return *this;
    }

    template<typename P>
    Predicates&& andAlso(P&& predicate) && {
        andPush(std::forward<P>(predicate));
        return std::move(*this);
    }

    template<typename Range>
    Predicates& andAll(const Range& predicates) & {
        andExtend(predicates);
        return *this;
    }

    template<typename Range>
    Predicates&& andAll(const Range& predicates) && {
        andExtend(predicates);
        return std::move(*this);
    }

    // The statement holds its own copy of the predicates; a temporary
    // collection hands its predicates over instead.
    PredicateStatement asWhere() const& { return PredicateStatement("WHERE", m_predicates); }
    PredicateStatement asWhere() && { return PredicateStatement("WHERE", std::move(m_predicates)); }

    const_iterator begin() const { return m_predicates.begin(); }
    const_iterator end() const { return m_predicates.end(); }
    size_t size() const { return m_predicates.size(); }
    bool empty() const { return m_predicates.empty(); }

private:
    std::vector<std::string> m_predicates;
};

std::ostream& operator<<(std::ostream& out, const PredicateStatement& statement);

template<> struct IsSqlFragment<PredicateStatement> : std::true_type {};

}  // namespace sqlquote
