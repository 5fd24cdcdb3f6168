#include <boost/ut.hpp>

#include <limits>
#include <string>

#include <fmt/format.h>

#include <kinship/LayoutOptions.hpp>

const boost::ut::suite<"LayoutOptions"> layoutOptionsTests = [] {
    using namespace boost::ut;
    using namespace std::string_literals;
    using kin::Direction;

    "parseDirection"_test = [] {
        expect(kin::parseDirection("top-down").value() == Direction::TopDown);
        expect(kin::parseDirection("Down").value() == Direction::TopDown);
        expect(kin::parseDirection("LEFT-RIGHT").value() == Direction::LeftRight);
        expect(kin::parseDirection("across").value() == Direction::LeftRight);

        auto invalid = kin::parseDirection("diagonal");
        expect(eq(invalid.has_value(), false) >> fatal);
        expect(invalid.error().message.find("'diagonal'") != std::string::npos);
    };

    "direction names"_test = [] {
        static_assert(kin::directionName(Direction::TopDown) == "top-down");
        static_assert(kin::directionName(Direction::LeftRight) == "left-right");
        expect(eq(fmt::format("{}", Direction::LeftRight), "left-right"s));
        for (const auto direction : {Direction::TopDown, Direction::LeftRight}) {
            expect(kin::parseDirection(kin::directionName(direction)).value() == direction);
        }
    };

    "defaults"_test = [] {
        const kin::LayoutOptions options;
        expect(options.direction == Direction::TopDown);
        expect(options.rootPersonId.empty());
        expect(eq(options.spacingX, 200.0));
        expect(eq(options.spacingY, 150.0));
        expect(options.validate().has_value());
    };

    "validate"_test = [] {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();
        constexpr double inf = std::numeric_limits<double>::infinity();
        expect(kin::LayoutOptions{.spacingX = 0.5, .spacingY = 1e6}.validate().has_value());
        expect(!kin::LayoutOptions{.spacingX = 0.0}.validate().has_value());
        expect(!kin::LayoutOptions{.spacingX = -1.0}.validate().has_value());
        expect(!kin::LayoutOptions{.spacingX = nan}.validate().has_value());
        expect(!kin::LayoutOptions{.spacingY = inf}.validate().has_value());

        auto error = kin::LayoutOptions{.spacingY = -2.0}.validate();
        expect(eq(error.has_value(), false) >> fatal);
        expect(error.error().message.starts_with("spacing_y"));
    };
};

int main() { /* not needed for UT */ }
