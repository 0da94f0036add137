#pragma once

#include <optional>

#include "eligix/collection.hpp"

namespace eligix {

    /// @throws InvalidThresholdError for a negative or non-finite threshold
    void validate_threshold(double threshold);

    /**
     * @brief Drop polygons too small to matter
     *
     * Every feature is split into single polygons (holes kept). Polygons with an
     * area strictly below threshold are dropped and the survivors are regrouped
     * under the feature's attributes. Features left without polygons are removed,
     * including points and lines, which have no area.
     *
     * An absent or zero threshold returns the collection unchanged.
     *
     * @throws InvalidThresholdError for a negative or non-finite threshold
     */
    GeometryCollection remove_slivers(const GeometryCollection &collection, std::optional<double> threshold);

} // namespace eligix
