#include "eligix/sliver.hpp"

#include <cmath>
#include <string>

#include "eligix/errors.hpp"
#include "eligix/utils/utils.hpp"

namespace eligix {

    void validate_threshold(double threshold) {
        if (!std::isfinite(threshold))
            throw InvalidThresholdError("sliver threshold must be finite");
        if (threshold < 0.0)
            throw InvalidThresholdError("negative sliver threshold " + std::to_string(threshold));
    }

    GeometryCollection remove_slivers(const GeometryCollection &collection, std::optional<double> threshold) {
        if (!threshold)
            return collection;
        validate_threshold(*threshold);
        if (*threshold == 0.0)
            return collection;

        GeometryCollection out(collection.crs());
        for (const auto &feature : collection) {
            BMultiPolygon kept;
            for (const auto &polygon : utils::explode(utils::polygonal_part(feature.geometry))) {
                if (std::abs(bg::area(polygon)) >= *threshold)
                    kept.push_back(polygon);
            }
            if (kept.empty())
                continue;
            if (kept.size() == 1)
                out.add(Geometry{kept.front()}, feature.attributes);
            else
                out.add(Geometry{std::move(kept)}, feature.attributes);
        }
        return out;
    }

} // namespace eligix
