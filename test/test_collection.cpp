#include "doctest/doctest.h"
#include "eligix/collection.hpp"
#include "eligix/errors.hpp"
#include "eligix/loader.hpp"
#include "eligix/utils/utils.hpp"

#include <memory>

using namespace eligix;

namespace {

    datapod::Polygon square(double x, double y, double side) {
        datapod::Polygon poly;
        poly.vertices.push_back(datapod::Point{x, y, 0.0});
        poly.vertices.push_back(datapod::Point{x + side, y, 0.0});
        poly.vertices.push_back(datapod::Point{x + side, y + side, 0.0});
        poly.vertices.push_back(datapod::Point{x, y + side, 0.0});
        return poly;
    }

    Geometry wkt_polygon(const std::string &wkt) {
        BPolygon poly;
        bg::read_wkt(wkt, poly);
        return poly;
    }

} // namespace

TEST_CASE("GeometryCollection basics") {
    GeometryCollection collection(ReferenceSystem::local("site"));
    CHECK(collection.empty());

    collection.add(square(0, 0, 2), AttributeRecord{{"col1", AttributeValue{std::int64_t{1}}}});
    collection.add(square(2, 2, 2), AttributeRecord{{"col1", AttributeValue{std::int64_t{2}}}});
    collection.add(Geometry{BPoint{10, 10}});

    CHECK(collection.size() == 3);
    CHECK(collection.crs() == ReferenceSystem::local("site"));
    CHECK(collection.area() == doctest::Approx(8.0));
    CHECK(collection.polygons().size() == 2);
    CHECK(std::get<std::int64_t>(collection[1].attributes.at("col1")) == 2);

    // datapod rings are closed on the way in
    const auto &ring = std::get<BPolygon>(collection[0].geometry).outer();
    CHECK(ring.size() == 5);
}

TEST_CASE("Normalization") {
    GeometryCollection raw(ReferenceSystem::local("site"));
    // counter-clockwise, open ring: corrected
    raw.add(wkt_polygon("POLYGON((0 0,4 0,4 4,0 4))"));
    // self-intersecting bow tie: dropped
    raw.add(wkt_polygon("POLYGON((0 0,4 4,4 0,0 4,0 0))"));
    // empty: dropped
    raw.add(Geometry{BPolygon{}});
    raw.add(Geometry{BPoint{1, 1}});

    auto clean = normalized(raw, "included[0]");
    CHECK(clean.size() == 2);
    CHECK(is_polygonal(clean[0].geometry));
    CHECK(bg::area(std::get<BPolygon>(clean[0].geometry)) == doctest::Approx(16.0));
    CHECK(std::holds_alternative<BPoint>(clean[1].geometry));

    SUBCASE("Multi polygon parts sharing an edge are dissolved") {
        BMultiPolygon parts;
        bg::read_wkt("MULTIPOLYGON(((0 0,0 1,1 1,1 0,0 0)),((1 0,1 1,2 1,2 0,1 0)))", parts);
        Geometry geometry = parts;
        CHECK(normalize(geometry));
        const auto &dissolved = std::get<BMultiPolygon>(geometry);
        CHECK(dissolved.size() == 1);
        CHECK(bg::area(dissolved) == doctest::Approx(2.0));
    }

    SUBCASE("Multi polygon with a self-intersecting part is dropped") {
        BMultiPolygon parts;
        bg::read_wkt("MULTIPOLYGON(((0 0,4 4,4 0,0 4,0 0)),((5 0,5 1,6 1,6 0,5 0)))", parts);
        Geometry geometry = parts;
        CHECK_FALSE(normalize(geometry));
    }

    std::string reason;
    Geometry empty = BMultiPolygon{};
    CHECK_FALSE(normalize(empty, &reason));
    CHECK(reason == "empty geometry");
}

TEST_CASE("Region to collection") {
    BMultiPolygon region;
    BPolygon a, b;
    bg::read_wkt("POLYGON((0 0,0 1,1 1,1 0,0 0))", a);
    bg::read_wkt("POLYGON((5 5,5 7,7 7,7 5,5 5))", b);
    region.push_back(a);
    region.push_back(b);

    auto collection = to_collection(region, ReferenceSystem::local("site"));
    REQUIRE(collection.size() == 2);
    CHECK(collection[0].attributes.empty());
    CHECK(utils::area(collection[1].geometry) == doctest::Approx(4.0));
}

TEST_CASE("CatalogLoader") {
    datapod::Geo datum{52.0, 5.0, 0.0};
    auto target = ReferenceSystem::enu(datum);

    GeometryCollection fields(target);
    fields.add(square(0, 0, 10));
    fields.add(wkt_polygon("POLYGON((0 0,4 4,4 0,0 4,0 0))"));

    CatalogLoader loader;
    loader.add("data/./fields.geojson", fields);
    CHECK(loader.contains("data/fields.geojson"));

    SUBCASE("Registered path") {
        GeometrySpec spec(std::filesystem::path("data/fields.geojson"));
        CHECK(spec.is_path());
        auto loaded = loader.load(spec, target);
        CHECK(loaded.size() == 1);
        CHECK(loaded.area() == doctest::Approx(100.0));
    }

    SUBCASE("In-memory source") {
        auto loaded = loader.load(GeometrySpec(fields), target);
        CHECK(loaded.size() == 1);
    }

    SUBCASE("Unregistered path") {
        CHECK_THROWS_AS(loader.load(GeometrySpec(std::filesystem::path("missing.shp")), target),
                        LayerResolutionError);
    }

    SUBCASE("Undetermined source system") {
        GeometryCollection unknown;
        unknown.add(square(0, 0, 1));
        CHECK_THROWS_AS(loader.load(GeometrySpec(unknown), target), CRSResolutionError);
    }

    SUBCASE("Engineering plane cannot reach the earth") {
        GeometryCollection site(ReferenceSystem::local("site"));
        site.add(square(0, 0, 1));
        CHECK_THROWS_AS(loader.load(GeometrySpec(site), target), CRSResolutionError);
    }

    SUBCASE("Geographic source is reprojected") {
        GeometryCollection wgs(ReferenceSystem::wgs84());
        wgs.add(wkt_polygon("POLYGON((5 52,5 52.001,5.001 52.001,5.001 52,5 52))"));
        auto loaded = loader.load(GeometrySpec(wgs), target);
        REQUIRE(loaded.size() == 1);
        CHECK(loaded.crs() == target);
        // roughly 68.6 m by 111.3 m at 52 degrees north
        CHECK(loaded.area() == doctest::Approx(7640.0).epsilon(0.01));
    }
}
