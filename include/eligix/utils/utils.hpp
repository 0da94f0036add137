#pragma once

#include <cmath>
#include <cstddef>
#include <variant>
#include <vector>

#include <datapod/datapod.hpp>

#include "eligix/types.hpp"

namespace eligix {

    namespace utils {

        /**
         * @brief Check if two points are approximately equal
         *
         * @param p1 First point
         * @param p2 Second point
         * @param epsilon Tolerance
         * @return true if points are approximately equal
         */
        inline bool points_equal(const BPoint &p1, const BPoint &p2, double epsilon = 1e-10) {
            double dx = p1.x() - p2.x();
            double dy = p1.y() - p2.y();
            return (dx * dx + dy * dy) < epsilon * epsilon;
        }

        /**
         * @brief Convert a datapod polygon to a boost polygon
         *
         * The ring is closed if needed and corrected to boost's clockwise
         * orientation. Z is dropped.
         */
        inline BPolygon to_boost(const datapod::Polygon &polygon) {
            BPolygon out;
            for (const auto &pt : polygon.vertices) {
                out.outer().emplace_back(pt.x, pt.y);
            }
            if (!out.outer().empty() && !points_equal(out.outer().front(), out.outer().back())) {
                out.outer().push_back(out.outer().front());
            }
            bg::correct(out);
            return out;
        }

        /**
         * @brief Convert a boost polygon's outer ring to a datapod polygon
         *
         * Holes are not representable in datapod::Polygon and are left out. The
         * returned ring is closed (first == last).
         */
        inline datapod::Polygon from_boost(const BPolygon &polygon, double z = 0.0) {
            datapod::Polygon out;
            for (const auto &pt : polygon.outer()) {
                out.vertices.push_back(datapod::Point{pt.x(), pt.y(), z});
            }
            return out;
        }

        /**
         * @brief Polygonal part of a geometry as a multi polygon
         *
         * Points and lines have no area and yield an empty result.
         */
        inline BMultiPolygon polygonal_part(const Geometry &geometry) {
            if (const auto *poly = std::get_if<BPolygon>(&geometry)) {
                BMultiPolygon out;
                out.push_back(*poly);
                return out;
            }
            if (const auto *multi = std::get_if<BMultiPolygon>(&geometry)) {
                return *multi;
            }
            return {};
        }

        /// Area of a geometry (zero for points and lines)
        inline double area(const Geometry &geometry) {
            return std::visit(
                [](const auto &g) -> double {
                    using T = std::decay_t<decltype(g)>;
                    if constexpr (std::is_same_v<T, BPolygon> || std::is_same_v<T, BMultiPolygon>) {
                        return std::abs(bg::area(g));
                    } else {
                        return 0.0;
                    }
                },
                geometry);
        }

        /// Total area of a multi polygon
        inline double area(const BMultiPolygon &polygons) { return std::abs(bg::area(polygons)); }

        /// Split a multi polygon into its single-part constituents
        inline std::vector<BPolygon> explode(const BMultiPolygon &polygons) {
            return std::vector<BPolygon>(polygons.begin(), polygons.end());
        }

    } // namespace utils

} // namespace eligix
