#pragma once

#include <variant>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace eligix {

    namespace bg = boost::geometry;

    /// Planar coordinate pair (x = easting or longitude, y = northing or latitude)
    using BPoint = bg::model::d2::point_xy<double>;
    using BMultiPoint = bg::model::multi_point<BPoint>;
    using BLineString = bg::model::linestring<BPoint>;
    using BMultiLineString = bg::model::multi_linestring<BLineString>;
    using BPolygon = bg::model::polygon<BPoint>;
    using BMultiPolygon = bg::model::multi_polygon<BPolygon>;
    using BBox = bg::model::box<BPoint>;

    /**
     * @brief Any single geometry a layer can carry
     *
     * Only the polygonal alternatives take part in the set algebra. Points and
     * lines become polygonal once they are buffered.
     */
    using Geometry = std::variant<BPoint, BMultiPoint, BLineString, BMultiLineString, BPolygon, BMultiPolygon>;

    /// True for BPolygon and BMultiPolygon
    inline bool is_polygonal(const Geometry &geometry) {
        return std::holds_alternative<BPolygon>(geometry) || std::holds_alternative<BMultiPolygon>(geometry);
    }

} // namespace eligix
