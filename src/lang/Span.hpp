#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <string_view>

namespace Interpreter
{

// Half-open byte range into the script source.
struct [[nodiscard]] Span final
{
    [[nodiscard]] auto static join(const Span& lhs, const Span& rhs) -> Span
    {
        return Span { .start = lhs.start, .end = rhs.end };
    }

    // 1-based line of `start`, for diagnostics.
    [[nodiscard]] auto line_in(const std::string_view source) const -> std::size_t
    {
        const auto prefix = source.substr(0, std::min(start, source.size()));
        return static_cast<std::size_t>(std::ranges::count(prefix, '\n')) + 1;
    }

    std::size_t start = 0;
    std::size_t end   = 0;
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::Span>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Span& span, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{{ start = {}, end = {} }}", span.start, span.end);
    }
};
