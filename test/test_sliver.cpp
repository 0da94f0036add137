#include "doctest/doctest.h"
#include "eligix/errors.hpp"
#include "eligix/sliver.hpp"

#include <limits>

using namespace eligix;

namespace {

    BPolygon polygon(const std::string &wkt) {
        BPolygon out;
        bg::read_wkt(wkt, out);
        bg::correct(out);
        return out;
    }

    // One feature with a 0.5 triangle beside a 9 square, one 16 square
    GeometryCollection fragments() {
        GeometryCollection collection(ReferenceSystem::local("site"));
        BMultiPolygon mixed;
        mixed.push_back(polygon("POLYGON((0 0,0 3,3 3,3 0,0 0))"));
        mixed.push_back(polygon("POLYGON((5 0,6 0,5 1,5 0))"));
        collection.add(Geometry{mixed}, AttributeRecord{{"id", AttributeValue{std::int64_t{1}}}});
        collection.add(Geometry{polygon("POLYGON((10 10,10 14,14 14,14 10,10 10))")},
                       AttributeRecord{{"id", AttributeValue{std::int64_t{2}}}});
        return collection;
    }

} // namespace

TEST_CASE("Sliver removal") {
    auto input = fragments();
    CHECK(input.area() == doctest::Approx(25.5));

    SUBCASE("Threshold 1 drops the 0.5 fragment") {
        auto cleaned = remove_slivers(input, 1.0);
        REQUIRE(cleaned.size() == 2);
        CHECK(cleaned.area() == doctest::Approx(25.0));
        CHECK(std::get<std::int64_t>(cleaned[0].attributes.at("id")) == 1);
        CHECK(std::holds_alternative<BPolygon>(cleaned[0].geometry));
    }

    SUBCASE("Threshold 0 and no threshold keep everything") {
        CHECK(remove_slivers(input, 0.0).area() == doctest::Approx(25.5));
        CHECK(remove_slivers(input, std::nullopt).area() == doctest::Approx(25.5));
    }

    SUBCASE("Features without survivors are removed") {
        auto cleaned = remove_slivers(input, 10.0);
        REQUIRE(cleaned.size() == 1);
        CHECK(std::get<std::int64_t>(cleaned[0].attributes.at("id")) == 2);
    }

    SUBCASE("A polygon exactly at the threshold is kept") {
        CHECK(remove_slivers(input, 9.0).area() == doctest::Approx(25.0));
    }

    SUBCASE("Holes count towards the area") {
        GeometryCollection holed(ReferenceSystem::local("site"));
        holed.add(Geometry{polygon("POLYGON((0 0,0 4,4 4,4 0,0 0),(1 1,3 1,3 3,1 3,1 1))")});
        CHECK(remove_slivers(holed, 12.0).size() == 1);
        CHECK(remove_slivers(holed, 12.5).empty());
    }

    SUBCASE("Idempotent") {
        auto once = remove_slivers(input, 1.0);
        auto twice = remove_slivers(once, 1.0);
        CHECK(twice.size() == once.size());
        CHECK(twice.area() == doctest::Approx(once.area()));
    }

    SUBCASE("Monotone in the threshold") {
        double previous = input.area();
        for (double threshold : {0.0, 0.25, 0.5, 1.0, 9.0, 9.5, 16.0, 20.0}) {
            double area = remove_slivers(input, threshold).area();
            CHECK(area <= previous);
            previous = area;
        }
        CHECK(previous == doctest::Approx(0.0));
    }
}

TEST_CASE("Invalid sliver thresholds") {
    auto input = fragments();
    CHECK_THROWS_AS(remove_slivers(input, -1.0), InvalidThresholdError);
    CHECK_THROWS_AS(remove_slivers(input, std::numeric_limits<double>::quiet_NaN()), InvalidThresholdError);
    CHECK_THROWS_AS(remove_slivers(input, std::numeric_limits<double>::infinity()), InvalidThresholdError);

    GeometryCollection empty(ReferenceSystem::local("site"));
    CHECK_THROWS_AS(remove_slivers(empty, -0.5), InvalidThresholdError);
}
