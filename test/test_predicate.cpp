#include "doctest/doctest.h"
#include "eligix/errors.hpp"
#include "eligix/predicate.hpp"

#include <string>

using eligix::AttributeRecord;
using eligix::AttributeValue;
using eligix::InvalidFilterError;
using eligix::Predicate;

namespace {

    AttributeRecord parcel(std::int64_t col1, const std::string &landuse, double slope) {
        return AttributeRecord{{"col1", AttributeValue{col1}},
                               {"landuse", AttributeValue{landuse}},
                               {"slope", AttributeValue{slope}},
                               {"protected", AttributeValue{false}},
                               {"owner", AttributeValue{}}};
    }

} // namespace

TEST_CASE("Typed predicates") {
    auto record = parcel(1, "arable", 4.5);

    CHECK(Predicate::eq("col1", 1).evaluate(record));
    CHECK_FALSE(Predicate::eq("col1", 2).evaluate(record));
    CHECK(Predicate::ne("landuse", "forest").evaluate(record));
    CHECK(Predicate::lt("slope", 5).evaluate(record));
    CHECK(Predicate::ge("slope", 4.5).evaluate(record));
    CHECK_FALSE(Predicate::gt("slope", 4.5).evaluate(record));

    SUBCASE("Boolean combination") {
        auto flat_arable = Predicate::eq("landuse", "arable") && Predicate::le("slope", 5.0);
        CHECK(flat_arable.evaluate(record));
        CHECK_FALSE((!flat_arable).evaluate(record));
        CHECK((Predicate::eq("col1", 7) || Predicate::eq("protected", false)).evaluate(record));
    }

    SUBCASE("Integers and doubles compare numerically") {
        CHECK(Predicate::eq("col1", 1.0).evaluate(record));
        CHECK(Predicate::lt("col1", 1.5).evaluate(record));
    }

    SUBCASE("Mixed types are never equal") {
        CHECK_FALSE(Predicate::eq("col1", "1").evaluate(record));
        CHECK(Predicate::ne("landuse", 3).evaluate(record));
        CHECK(Predicate::eq("owner", AttributeValue{}).evaluate(record));
    }

    SUBCASE("Referenced attributes") {
        auto p = Predicate::eq("landuse", "arable") && (Predicate::lt("slope", 5) || Predicate::eq("col1", 1));
        CHECK(p.attributes() == std::vector<std::string>{"col1", "landuse", "slope"});
    }
}

TEST_CASE("Predicate failures") {
    auto record = parcel(1, "arable", 4.5);

    SUBCASE("Absent attribute") {
        CHECK_THROWS_AS(Predicate::eq("crop", "wheat").evaluate(record), InvalidFilterError);
        // both sides of a conjunction are evaluated
        CHECK_THROWS_AS((Predicate::eq("col1", 2) && Predicate::eq("crop", "wheat")).evaluate(record),
                        InvalidFilterError);
    }

    SUBCASE("Ordering incompatible types") {
        CHECK_THROWS_AS(Predicate::lt("landuse", 3).evaluate(record), InvalidFilterError);
        CHECK_THROWS_AS(Predicate::gt("owner", 0).evaluate(record), InvalidFilterError);
    }

    SUBCASE("Failures derive from eligix::Error") {
        CHECK_THROWS_AS(Predicate::eq("crop", 1).evaluate(record), eligix::Error);
    }
}

TEST_CASE("Query parsing") {
    auto record = parcel(1, "arable", 4.5);

    CHECK(Predicate::parse("col1 == 1").evaluate(record));
    CHECK_FALSE(Predicate::parse("col1 == 2").evaluate(record));
    CHECK(Predicate::parse("landuse == 'arable' and slope < 5").evaluate(record));
    CHECK(Predicate::parse("landuse == \"forest\" or not protected").evaluate(record));
    CHECK(Predicate::parse("(col1 >= 1) & (slope <= 4.5)").evaluate(record));
    CHECK(Predicate::parse("col1 > -3").evaluate(record));
    CHECK(Predicate::parse("owner == None").evaluate(record));
    CHECK(Predicate::parse("protected == False").evaluate(record));

    SUBCASE("and binds tighter than or") {
        auto p = Predicate::parse("col1 == 2 and slope < 5 or landuse == 'arable'");
        CHECK(p.to_string() == "((col1 == 2 and slope < 5) or landuse == 'arable')");
        CHECK(p.evaluate(record));

        auto q = Predicate::parse("col1 == 2 and (slope < 5 or landuse == 'arable')");
        CHECK_FALSE(q.evaluate(record));
    }

    SUBCASE("Bare identifier tests for true") {
        AttributeRecord flagged{{"suitable", AttributeValue{true}}};
        CHECK(Predicate::parse("suitable").evaluate(flagged));
        CHECK_FALSE(Predicate::parse("~suitable").evaluate(flagged));
    }

    SUBCASE("Quoted identifiers") {
        AttributeRecord named{{"land use", AttributeValue{std::string("arable")}}};
        auto p = Predicate::parse("`land use` == 'arable'");
        CHECK(p.evaluate(named));
        CHECK(p.to_string() == "`land use` == 'arable'");
    }

    SUBCASE("Printed form parses back to the same predicate") {
        auto p = Predicate::parse("not (col1 == 1 or slope > 2.5) and landuse != 'forest'");
        CHECK(Predicate::parse(p.to_string()).to_string() == p.to_string());
    }
}

TEST_CASE("Malformed queries report their position") {
    auto message_of = [](const std::string &query) {
        try {
            Predicate::parse(query);
        } catch (const InvalidFilterError &e) {
            return std::string(e.what());
        }
        return std::string();
    };

    CHECK(message_of("col1 = 1").find("at position 5") != std::string::npos);
    CHECK(message_of("col1 == ").find("unexpected end of expression") != std::string::npos);
    CHECK(message_of("(col1 == 1").find("expected ')'") != std::string::npos);
    CHECK(message_of("landuse == 'arable").find("unterminated string") != std::string::npos);
    CHECK(message_of("").find("empty expression") != std::string::npos);
    CHECK(message_of("col1 == 1 col2").find("at position 10") != std::string::npos);
}
