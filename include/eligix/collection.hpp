#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "eligix/attributes.hpp"
#include "eligix/crs.hpp"
#include "eligix/types.hpp"

namespace eligix {

    /**
     * @brief One geometry with its attribute record
     */
    struct Feature {
        Geometry geometry;
        AttributeRecord attributes;
    };

    /**
     * @brief Ordered features sharing one reference system
     *
     * Collections are plain values. Every stage of the analysis takes one by
     * const reference and returns a new one.
     */
    class GeometryCollection {
      public:
        using const_iterator = std::vector<Feature>::const_iterator;

        GeometryCollection() = default;
        explicit GeometryCollection(ReferenceSystem crs) : crs_(std::move(crs)) {}

        const ReferenceSystem &crs() const { return crs_; }

        void add(Geometry geometry, AttributeRecord attributes = {});
        void add(const datapod::Polygon &polygon, AttributeRecord attributes = {});
        void add(Feature feature);

        std::size_t size() const { return features_.size(); }
        bool empty() const { return features_.empty(); }
        const Feature &operator[](std::size_t index) const { return features_[index]; }
        const std::vector<Feature> &features() const { return features_; }
        const_iterator begin() const { return features_.begin(); }
        const_iterator end() const { return features_.end(); }

        /// Sum of the polygonal areas, in squared units of crs()
        double area() const;

        /// Every polygonal part of every feature, exploded, not dissolved
        BMultiPolygon polygons() const;

        /// Copy expressed in another reference system
        GeometryCollection reprojected(const ReferenceSystem &target) const;

      private:
        ReferenceSystem crs_;
        std::vector<Feature> features_;
    };

    /**
     * @brief Make a geometry valid or report that it cannot be kept
     *
     * Rings are closed and oriented; the geometry is then checked with
     * boost::geometry::is_valid. The parts of an invalid multi polygon are
     * dissolved first, so parts sharing an edge become one polygon.
     *
     * @return false when the geometry is empty or still invalid after correction
     */
    bool normalize(Geometry &geometry, std::string *reason = nullptr);

    /**
     * @brief Copy of a collection holding only valid, non-empty geometries
     *
     * Dropped features are reported on std::cerr with the given label.
     */
    GeometryCollection normalized(const GeometryCollection &collection, const std::string &label = "");

    /**
     * @brief Collection with one feature per polygon of a region
     */
    GeometryCollection to_collection(const BMultiPolygon &region, const ReferenceSystem &crs);

} // namespace eligix
