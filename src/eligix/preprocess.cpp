#include "eligix/preprocess.hpp"

#include <cmath>
#include <string>

#include <boost/geometry/algorithms/buffer.hpp>
#include <boost/geometry/strategies/buffer.hpp>

#include "eligix/errors.hpp"
#include "eligix/utils/utils.hpp"

namespace eligix {

    namespace {

        template <typename G, typename JoinStrategy, typename EndStrategy, typename PointStrategy>
        BMultiPolygon buffer_with(const G &geometry, double distance, const JoinStrategy &join,
                                  const EndStrategy &end, const PointStrategy &point) {
            BMultiPolygon buffered;
            bg::strategy::buffer::distance_symmetric<double> dist_strategy(distance);
            bg::strategy::buffer::side_straight side_strategy;
            bg::buffer(geometry, buffered, dist_strategy, side_strategy, join, end, point);
            return buffered;
        }

        template <typename G> BMultiPolygon buffer_typed(const G &geometry, const BufferOptions &options) {
            const auto points = static_cast<std::size_t>(options.points_per_circle);
            if (options.join == JoinStyle::Miter) {
                bg::strategy::buffer::join_miter join(options.miter_limit);
                bg::strategy::buffer::point_square point;
                if (options.end == EndStyle::Flat)
                    return buffer_with(geometry, options.distance, join, bg::strategy::buffer::end_flat{}, point);
                return buffer_with(geometry, options.distance, join, bg::strategy::buffer::end_round(points), point);
            }
            bg::strategy::buffer::join_round join(points);
            bg::strategy::buffer::point_circle point(points);
            if (options.end == EndStyle::Flat)
                return buffer_with(geometry, options.distance, join, bg::strategy::buffer::end_flat{}, point);
            return buffer_with(geometry, options.distance, join, bg::strategy::buffer::end_round(points), point);
        }

        AttributeRecord project(const AttributeRecord &record, const std::vector<std::string> &names) {
            AttributeRecord out;
            for (const auto &name : names) {
                auto it = record.find(name);
                if (it != record.end())
                    out.insert(*it);
            }
            return out;
        }

    } // namespace

    void validate_buffer(const BufferOptions &options) {
        if (!std::isfinite(options.distance))
            throw InvalidBufferError("buffer distance must be finite");
        if (options.distance < 0.0)
            throw InvalidBufferError("negative buffer distance " + std::to_string(options.distance) +
                                     " (erosion is not supported)");
        if (options.points_per_circle < 3)
            throw InvalidBufferError("points_per_circle must be at least 3");
        if (!std::isfinite(options.miter_limit) || options.miter_limit < 1.0)
            throw InvalidBufferError("miter_limit must be at least 1");
    }

    BMultiPolygon buffer_geometry(const Geometry &geometry, const BufferOptions &options) {
        if (options.distance == 0.0)
            return utils::polygonal_part(geometry);

        try {
            return std::visit(
                [&options](const auto &g) {
                    std::string message;
                    if (!bg::is_valid(g, message))
                        throw GeometryOperationError("buffer failed: " + message);
                    return buffer_typed(g, options);
                },
                geometry);
        } catch (const Error &) {
            throw;
        } catch (const std::exception &e) {
            throw GeometryOperationError(std::string("buffer failed: ") + e.what());
        }
    }

    GeometryCollection process(const GeometryCollection &collection, const std::optional<Predicate> &where,
                               const std::optional<BufferOptions> &buffer,
                               const std::optional<std::vector<std::string>> &keep_attributes) {
        // buffer options are checked up front so a bad layer fails even when empty
        if (buffer)
            validate_buffer(*buffer);

        GeometryCollection filtered(collection.crs());
        for (const auto &feature : collection) {
            if (where && !where->evaluate(feature.attributes))
                continue;
            Feature kept{feature.geometry,
                         keep_attributes ? project(feature.attributes, *keep_attributes) : feature.attributes};
            filtered.add(std::move(kept));
        }

        if (!buffer)
            return normalized(filtered);

        GeometryCollection out(collection.crs());
        for (const auto &feature : filtered) {
            BMultiPolygon dilated = buffer_geometry(feature.geometry, *buffer);
            if (dilated.empty())
                continue;
            out.add(Geometry{std::move(dilated)}, feature.attributes);
        }
        return normalized(out);
    }

    GeometryCollection process(const GeometryCollection &collection, const GeometrySpec &spec) {
        return process(collection, spec.where(), spec.buffer(), spec.keep_attributes());
    }

} // namespace eligix
