#ifndef KINSHIP_ERROR_HPP
#define KINSHIP_ERROR_HPP

#include <chrono>
#include <exception>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <kinship/meta/formatter.hpp>

namespace kin {

struct exception : public std::exception {
    std::string                           message;
    std::source_location                  sourceLocation;
    std::chrono::system_clock::time_point errorTime = std::chrono::system_clock::now();

    exception(std::string_view msg = "unknown exception", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    [[nodiscard]] const char* what() const noexcept override {
        if (formattedMessage.empty()) {
            formattedMessage = fmt::format("{} at {}:{}", message, sourceLocation.file_name(), sourceLocation.line());
        }
        return formattedMessage.c_str();
    }

private:
    mutable std::string formattedMessage;
};

struct Error {
    std::string                           message;
    std::source_location                  sourceLocation;
    std::chrono::system_clock::time_point errorTime = std::chrono::system_clock::now();

    Error(std::string_view msg = "unknown error", std::source_location location = std::source_location::current(), //
        std::chrono::system_clock::time_point time = std::chrono::system_clock::now()) noexcept                     //
        : message(msg), sourceLocation(location), errorTime(time) {}

    [[nodiscard]] std::string isoTime() const noexcept { return time::getIsoTime(errorTime); }
};

static_assert(std::is_default_constructible_v<Error>);
static_assert(!std::is_trivially_copyable_v<Error>); // because of the usage of std::string

} // namespace kin

template<>
struct fmt::formatter<kin::Error> {
    char presentation = 's';

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 'f' || *it == 't' || *it == 's')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format");
        }
        return it;
    }

    // 's': location and message, 'f': adds the method name, 't': adds the ISO time stamp
    template<typename FormatContext>
    auto format(const kin::Error& err, FormatContext& ctx) const -> decltype(ctx.out()) {
        switch (presentation) {
        case 't': return fmt::format_to(ctx.out(), "{}: {:t}: {} in method: {}", err.isoTime(), err.sourceLocation, err.message, err.sourceLocation.function_name());
        case 'f': return fmt::format_to(ctx.out(), "{:t}: {} in method: {}", err.sourceLocation, err.message, err.sourceLocation.function_name());
        case 's':
        default: return fmt::format_to(ctx.out(), "{:t}: {}", err.sourceLocation, err.message);
        }
    }
};

#endif // KINSHIP_ERROR_HPP
