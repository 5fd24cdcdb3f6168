#ifndef KINSHIP_FORMATTER_HPP
#define KINSHIP_FORMATTER_HPP

#include <chrono>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace kin {
namespace time {
[[nodiscard]] inline std::string getIsoTime(std::chrono::system_clock::time_point timePoint = std::chrono::system_clock::now()) noexcept {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
    const auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - secs).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}", fmt::localtime(std::chrono::system_clock::to_time_t(timePoint)), ms); // ms-precision ISO time-format
}
} // namespace time

template<std::ranges::input_range R>
std::string join(const R& range, std::string_view sep = ", ") {
    std::string out;
    auto        it  = std::ranges::begin(range);
    const auto  end = std::ranges::end(range);
    if (it != end) {
        out += fmt::format("{}", *it);
        while (++it != end) {
            out += fmt::format("{}{}", sep, *it);
        }
    }
    return out;
}
} // namespace kin

template<>
struct fmt::formatter<std::source_location> {
    char presentation = 's';

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f' || *it == 't')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format specifier for source_location");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::source_location& loc, FormatContext& ctx) const -> decltype(ctx.out()) {
        switch (presentation) {
        case 's': return fmt::format_to(ctx.out(), "{}", loc.file_name());
        case 't': return fmt::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        case 'f':
        default: return fmt::format_to(ctx.out(), "{}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
        }
    }
};

#endif // KINSHIP_FORMATTER_HPP
