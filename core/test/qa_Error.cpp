#include <boost/ut.hpp>

#include <string>

#include <fmt/format.h>

#include <kinship/Error.hpp>

const boost::ut::suite<"Error"> errorTests = [] {
    using namespace boost::ut;
    using namespace std::string_literals;

    "Error carries message and location"_test = [] {
        const auto       location = std::source_location::current();
        const kin::Error error("something failed", location);
        expect(eq(error.message, "something failed"s));
        expect(eq(error.sourceLocation.line(), location.line()));
        expect(!error.isoTime().empty());
    };

    "Error formatter"_test = [] {
        const auto        location = std::source_location::current();
        const kin::Error  error("boom", location);
        expect(eq(fmt::format("{}", error), fmt::format("{}:{}: boom", location.file_name(), location.line())));
        expect(fmt::format("{:f}", error).ends_with(fmt::format("in method: {}", location.function_name())));
        expect(fmt::format("{:t}", error).starts_with(error.isoTime()));
    };

    "exception::what"_test = [] {
        expect(throws<kin::exception>([] { throw kin::exception("bad input"); }));
        try {
            throw kin::exception("bad input");
        } catch (const std::exception& ex) {
            expect(std::string(ex.what()).starts_with("bad input at "));
        }
    };
};

int main() { /* not needed for UT */ }
