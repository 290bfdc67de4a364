#include "Predicates.hpp"

namespace sqlquote {

std::string PredicateStatement::toString() const {
    if (m_predicates.empty()) {
        return "";
    }

    std::string result = m_keyword;
    result += ' ';
    for (size_t i = 0; i < m_predicates.size(); ++i) {
        if (i > 0) result += "\nAND ";
        result += m_predicates[i];
    }
    return result;
}

std::ostream& operator<<(std::ostream& out, const PredicateStatement& statement) {
    return out << statement.toString();
}

}  // namespace sqlquote
