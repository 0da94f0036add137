#include "doctest/doctest.h"
#include "eligix/crs.hpp"
#include "eligix/errors.hpp"

#include <concord/concord.hpp>

using eligix::CRSResolutionError;
using eligix::ReferenceSystem;

TEST_CASE("Reference system identifiers") {
    SUBCASE("Geographic aliases") {
        CHECK(ReferenceSystem::parse("EPSG:4326") == ReferenceSystem::wgs84());
        CHECK(ReferenceSystem::parse("wgs84") == ReferenceSystem::wgs84());
        CHECK(ReferenceSystem::parse(" WGS ").identifier() == "EPSG:4326");
        CHECK(ReferenceSystem::wgs84().is_geographic());
    }

    SUBCASE("Local tangent plane") {
        auto crs = ReferenceSystem::parse("enu:52, 5");
        CHECK(crs.kind() == ReferenceSystem::Kind::LocalTangent);
        CHECK(crs == ReferenceSystem::enu(datapod::Geo{52.0, 5.0, 0.0}));
        CHECK(crs.identifier() == "ENU:52,5,0");
        CHECK(crs.datum().latitude == doctest::Approx(52.0));
        CHECK(crs.datum().longitude == doctest::Approx(5.0));
        CHECK(ReferenceSystem::parse("ENU:52,5,10") != crs);
    }

    SUBCASE("Engineering plane") {
        auto crs = ReferenceSystem::parse("LOCAL:site");
        CHECK(crs.kind() == ReferenceSystem::Kind::Engineering);
        CHECK(crs == ReferenceSystem::local("site"));
        CHECK(crs != ReferenceSystem::local("other"));
    }

    SUBCASE("Default is undetermined") {
        ReferenceSystem crs;
        CHECK_FALSE(crs.determined());
        CHECK(crs.identifier().empty());
    }

    SUBCASE("Rejected identifiers") {
        CHECK_THROWS_AS(ReferenceSystem::parse(""), CRSResolutionError);
        CHECK_THROWS_AS(ReferenceSystem::parse("EPSG:28992"), CRSResolutionError);
        CHECK_THROWS_AS(ReferenceSystem::parse("ENU:52"), CRSResolutionError);
        CHECK_THROWS_AS(ReferenceSystem::parse("ENU:95,5"), CRSResolutionError);
        CHECK_THROWS_AS(ReferenceSystem::parse("ENU:52,east"), CRSResolutionError);
        CHECK_THROWS_AS(ReferenceSystem::parse("LOCAL:"), CRSResolutionError);
    }
}

TEST_CASE("Reprojection compatibility") {
    auto wgs = ReferenceSystem::wgs84();
    auto enu = ReferenceSystem::enu(datapod::Geo{52.0, 5.0, 0.0});
    auto site = ReferenceSystem::local("site");

    CHECK(eligix::can_reproject(wgs, enu));
    CHECK(eligix::can_reproject(enu, wgs));
    CHECK(eligix::can_reproject(site, site));
    CHECK_FALSE(eligix::can_reproject(site, enu));
    CHECK_FALSE(eligix::can_reproject(ReferenceSystem{}, wgs));

    eligix::Geometry point = eligix::BPoint{1.0, 2.0};
    CHECK_THROWS_AS(eligix::reproject(point, site, wgs), CRSResolutionError);
    CHECK_THROWS_AS(eligix::reproject(point, ReferenceSystem{}, site), CRSResolutionError);
}

TEST_CASE("Reprojection through WGS84") {
    datapod::Geo datum{52.0, 5.0, 0.0};
    auto wgs = ReferenceSystem::wgs84();
    auto enu = ReferenceSystem::enu(datum);

    SUBCASE("Datum maps to the origin") {
        eligix::Geometry g = eligix::BPoint{5.0, 52.0};
        eligix::reproject(g, wgs, enu);
        const auto &p = std::get<eligix::BPoint>(g);
        CHECK(p.x() == doctest::Approx(0.0).epsilon(1e-6));
        CHECK(p.y() == doctest::Approx(0.0).epsilon(1e-6));
    }

    SUBCASE("Agrees with concord") {
        concord::earth::WGS corner{52.001, 5.002, 0.0};
        auto expected = concord::frame::to_enu(datum, corner);

        eligix::Geometry g = eligix::BPoint{5.002, 52.001};
        eligix::reproject(g, wgs, enu);
        const auto &p = std::get<eligix::BPoint>(g);
        CHECK(p.x() == doctest::Approx(expected.east()));
        CHECK(p.y() == doctest::Approx(expected.north()));
    }

    SUBCASE("Round trip keeps the polygon") {
        eligix::BPolygon square;
        eligix::bg::read_wkt("POLYGON((0 0,0 100,100 100,100 0,0 0))", square);
        eligix::Geometry g = square;
        eligix::reproject(g, enu, wgs);
        eligix::reproject(g, wgs, enu);
        CHECK(eligix::bg::area(std::get<eligix::BPolygon>(g)) == doctest::Approx(10000.0).epsilon(1e-6));
    }

    SUBCASE("Latitude outside the domain") {
        eligix::Geometry g = eligix::BPoint{5.0, 120.0};
        CHECK_THROWS_AS(eligix::reproject(g, wgs, enu), CRSResolutionError);
    }
}
