#pragma once

#include <vector>

#include "eligix/collection.hpp"
#include "eligix/crs.hpp"
#include "eligix/types.hpp"

namespace eligix {

    /**
     * @name Region algebra
     *
     * Thin wrappers over boost::geometry overlay operations on multi polygons.
     * Operands failing boost::geometry::is_valid (self-intersections, invalid
     * coordinates) and kernel exceptions are reported as GeometryOperationError.
     * @{
     */
    BMultiPolygon unite(const BMultiPolygon &lhs, const BMultiPolygon &rhs);
    BMultiPolygon subtract(const BMultiPolygon &lhs, const BMultiPolygon &rhs);
    BMultiPolygon intersect(const BMultiPolygon &lhs, const BMultiPolygon &rhs);
    /** @} */

    /**
     * @brief Dissolve polygons into disjoint regions
     *
     * Reduces pairwise in a balanced tree so the outcome does not depend on the
     * order of the input beyond floating point tolerance.
     */
    BMultiPolygon dissolve(const std::vector<BMultiPolygon> &parts);

    /**
     * @brief Dissolved region of every polygonal geometry in the collections
     *
     * Non-polygonal geometries are ignored.
     *
     * @throws CRSResolutionError if a collection is not expressed in crs
     */
    BMultiPolygon region_of(const std::vector<GeometryCollection> &collections, const ReferenceSystem &crs);

    /**
     * @brief Geometric union of a list of collections
     *
     * Overlapping or touching areas merge into single regions; the result holds
     * one attribute-less feature per region. An empty list yields an empty
     * collection.
     */
    GeometryCollection unite(const std::vector<GeometryCollection> &collections, const ReferenceSystem &crs);

} // namespace eligix
