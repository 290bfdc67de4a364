#include "QuotedData.hpp"
#include "SqlEscaper.hpp"

namespace sqlquote {

std::string QuotedData::toString() const {
    return SqlEscaper::quoteLiteral(m_value);
}

QuotedData QuotedData::map(const std::function<std::string(std::string_view)>& fn) const {
    return QuotedData(fn(m_value));
}

std::ostream& operator<<(std::ostream& out, const QuotedData& data) {
    return out << data.toString();
}

}  // namespace sqlquote
