#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <type_traits>

namespace sqlquote {

// Marks a type whose toString() yields ready-to-embed SQL text. Each
// wrapper header specializes this to std::true_type.
template<typename T>
struct IsSqlFragment : std::false_type {};

template<typename T>
inline constexpr bool isSqlFragment = IsSqlFragment<std::decay_t<T>>::value;

}  // namespace sqlquote

namespace fmt {

// Lets every fragment be passed straight to fmt::format and spdlog.
template<typename T>
struct formatter<T, char, std::enable_if_t<sqlquote::isSqlFragment<T>>>
    : formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const T& fragment, FormatContext& ctx) const -> decltype(ctx.out()) {
        const std::string text = fragment.toString();
        return formatter<std::string_view>::format(text, ctx);
    }
};

}  // namespace fmt
