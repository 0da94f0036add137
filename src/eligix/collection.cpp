#include "eligix/collection.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "eligix/utils/utils.hpp"

namespace eligix {

    void GeometryCollection::add(Geometry geometry, AttributeRecord attributes) {
        features_.push_back(Feature{std::move(geometry), std::move(attributes)});
    }

    void GeometryCollection::add(const datapod::Polygon &polygon, AttributeRecord attributes) {
        add(Geometry{utils::to_boost(polygon)}, std::move(attributes));
    }

    void GeometryCollection::add(Feature feature) { features_.push_back(std::move(feature)); }

    double GeometryCollection::area() const {
        double total = 0.0;
        for (const auto &feature : features_) {
            total += utils::area(feature.geometry);
        }
        return total;
    }

    BMultiPolygon GeometryCollection::polygons() const {
        BMultiPolygon out;
        for (const auto &feature : features_) {
            auto part = utils::polygonal_part(feature.geometry);
            out.insert(out.end(), part.begin(), part.end());
        }
        return out;
    }

    GeometryCollection GeometryCollection::reprojected(const ReferenceSystem &target) const {
        GeometryCollection out(target);
        out.features_.reserve(features_.size());
        for (const auto &feature : features_) {
            Feature copy = feature;
            reproject(copy.geometry, crs_, target);
            out.features_.push_back(std::move(copy));
        }
        return out;
    }

    namespace {

        template <typename G> void dissolve_parts(G &) {}

        // Parts sharing an edge are merged into one polygon
        void dissolve_parts(BMultiPolygon &multi) {
            BMultiPolygon merged;
            for (const auto &part : multi) {
                if (!bg::is_valid(part))
                    return;
                if (merged.empty()) {
                    merged.push_back(part);
                    continue;
                }
                BMultiPolygon next;
                try {
                    bg::union_(merged, part, next);
                } catch (const std::exception &e) {
                    std::cerr << "Warning: could not dissolve multi polygon parts: " << e.what() << std::endl;
                    return;
                }
                merged = std::move(next);
            }
            bg::correct(merged);
            multi = std::move(merged);
        }

    } // namespace

    bool normalize(Geometry &geometry, std::string *reason) {
        return std::visit(
            [reason](auto &g) {
                if (bg::is_empty(g)) {
                    if (reason)
                        *reason = "empty geometry";
                    return false;
                }
                bg::correct(g);
                std::string message;
                if (!bg::is_valid(g)) {
                    dissolve_parts(g);
                }
                if (!bg::is_valid(g, message)) {
                    if (reason)
                        *reason = message;
                    return false;
                }
                return true;
            },
            geometry);
    }

    GeometryCollection normalized(const GeometryCollection &collection, const std::string &label) {
        GeometryCollection out(collection.crs());
        for (std::size_t i = 0; i < collection.size(); ++i) {
            Feature feature = collection[i];
            std::string reason;
            if (!normalize(feature.geometry, &reason)) {
                std::cerr << "Warning: " << (label.empty() ? std::string("layer") : label) << " dropped feature " << i
                          << ": " << reason << std::endl;
                continue;
            }
            out.add(std::move(feature));
        }
        return out;
    }

    GeometryCollection to_collection(const BMultiPolygon &region, const ReferenceSystem &crs) {
        GeometryCollection out(crs);
        for (const auto &polygon : region) {
            if (bg::is_empty(polygon))
                continue;
            out.add(Geometry{polygon});
        }
        return out;
    }

} // namespace eligix
