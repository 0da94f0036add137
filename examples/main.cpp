#include <iomanip>
#include <iostream>

#include <datapod/datapod.hpp>

#include "eligix/eligix.hpp"
#include "eligix/utils/utils.hpp"

namespace {

    datapod::Polygon rectangle(double x0, double y0, double x1, double y1) {
        datapod::Polygon poly;
        poly.vertices.push_back(datapod::Point{x0, y0, 0.0});
        poly.vertices.push_back(datapod::Point{x1, y0, 0.0});
        poly.vertices.push_back(datapod::Point{x1, y1, 0.0});
        poly.vertices.push_back(datapod::Point{x0, y1, 0.0});
        poly.vertices.push_back(datapod::Point{x0, y0, 0.0}); // Close
        return poly;
    }

    void print_areas(const std::string &title, const eligix::GeometryCollection &collection) {
        std::cout << title << ": " << collection.size() << " polygons, area " << collection.area() << std::endl;
        for (const auto &feature : collection) {
            const auto &polygon = std::get<eligix::BPolygon>(feature.geometry);
            datapod::Polygon ring = eligix::utils::from_boost(polygon);
            std::cout << "  ";
            for (const auto &pt : ring.vertices)
                std::cout << "(" << pt.x << ", " << pt.y << ") ";
            std::cout << std::endl;
        }
    }

} // namespace

int main() {
    // Field corner used as the origin of the analysis plane
    datapod::Geo datum{51.98954034749562, 5.6584737410504715, 53.801823};
    auto crs = eligix::ReferenceSystem::enu(datum);

    eligix::GeometryCollection base(crs);
    base.add(rectangle(1, 0, 6, 6));

    eligix::GeometryCollection included(crs);
    datapod::Polygon corridor;
    corridor.vertices.push_back(datapod::Point{0.0, 4.0, 0.0});
    corridor.vertices.push_back(datapod::Point{0.0, 5.0, 0.0});
    corridor.vertices.push_back(datapod::Point{3.0, 5.0, 0.0});
    corridor.vertices.push_back(datapod::Point{6.0, 5.0, 0.0});
    corridor.vertices.push_back(datapod::Point{6.0, 4.0, 0.0});
    corridor.vertices.push_back(datapod::Point{3.0, 1.0, 0.0});
    corridor.vertices.push_back(datapod::Point{0.0, 4.0, 0.0});
    included.add(corridor);

    // Left exclusion needs a square buffer of one unit
    eligix::GeometryCollection excluded_left(crs);
    excluded_left.add(rectangle(1, 1, 2, 2));
    eligix::GeometryCollection excluded_right(crs);
    excluded_right.add(rectangle(4, 0, 5, 6));

    eligix::AnalysisInput input{
        eligix::GeometrySpec(base).with_name("base"),
        {eligix::GeometrySpec(included).with_name("corridor")},
        {eligix::GeometrySpec(excluded_left).with_name("left").with_buffer(1.0),
         eligix::GeometrySpec(excluded_right).with_name("right")},
        {},
    };

    // A threshold of 2 removes the small eligible strip on the right
    eligix::AnalysisConfig config;
    config.crs = crs;
    config.sliver_threshold = 2.0;
    config.verbose = true;

    try {
        auto output = eligix::run_analysis(input, config);
        std::cout << std::fixed << std::setprecision(3);
        print_areas("Eligible", output.eligible);
        print_areas("Eligible with restrictions", output.eligible_with_restrictions);
    } catch (const eligix::Error &e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
