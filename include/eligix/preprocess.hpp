#pragma once

#include <optional>
#include <string>
#include <vector>

#include "eligix/collection.hpp"
#include "eligix/predicate.hpp"
#include "eligix/spec.hpp"

namespace eligix {

    /**
     * @brief Reject buffer options that cannot dilate
     *
     * @throws InvalidBufferError for a negative or non-finite distance, fewer than
     *         3 points per circle, or a miter limit below 1
     */
    void validate_buffer(const BufferOptions &options);

    /**
     * @brief Dilate one geometry
     *
     * A zero distance keeps polygonal geometry as it is and collapses points and
     * lines to nothing.
     *
     * @throws GeometryOperationError if the geometry is not valid or the kernel fails
     */
    BMultiPolygon buffer_geometry(const Geometry &geometry, const BufferOptions &options);

    /**
     * @brief Filter, then buffer, a normalized collection
     *
     * @param collection Input layer, left unchanged
     * @param where Records not satisfying it are dropped
     * @param buffer Dilation applied to every remaining geometry
     * @param keep_attributes Attributes kept on each record (all when absent)
     * @return New normalized collection in the same reference system
     */
    GeometryCollection process(const GeometryCollection &collection, const std::optional<Predicate> &where,
                               const std::optional<BufferOptions> &buffer,
                               const std::optional<std::vector<std::string>> &keep_attributes = std::nullopt);

    /// process() with the where / buffer / keep_attributes of a spec
    GeometryCollection process(const GeometryCollection &collection, const GeometrySpec &spec);

} // namespace eligix
