#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "eligix/collection.hpp"
#include "eligix/predicate.hpp"

namespace eligix {

    /// Corner treatment of a buffer
    enum class JoinStyle {
        Miter, ///< Sharp corners
        Round, ///< Arcs around convex corners
    };

    /// End treatment of buffered lines
    enum class EndStyle {
        Flat,  ///< Cut square at the line end
        Round, ///< Half disc around the line end
    };

    /**
     * @brief Dilation applied to every geometry of a layer
     *
     * distance is expressed in the linear units of the analysis reference system.
     * Erosion is not supported: a negative distance is rejected when the layer is
     * processed.
     */
    struct BufferOptions {
        double distance = 0.0;
        JoinStyle join = JoinStyle::Miter;
        EndStyle end = EndStyle::Flat;
        int points_per_circle = 36;
        double miter_limit = 5.0;

        BufferOptions() = default;
        explicit BufferOptions(double d, JoinStyle j = JoinStyle::Miter, EndStyle e = EndStyle::Flat)
            : distance(d), join(j), end(e) {}
    };

    /**
     * @brief Immutable descriptor of one input layer
     *
     * The source is either a path, resolved by the LayerLoader, or an in-memory
     * collection shared with the caller. The where clause is applied before the
     * buffer. keep_attributes limits the attributes carried into the processed
     * collection. Absent means keep everything.
     */
    class GeometrySpec {
      public:
        using Source = std::variant<std::filesystem::path, std::shared_ptr<const GeometryCollection>>;

        GeometrySpec(std::filesystem::path path) : source_(std::move(path)) {}
        GeometrySpec(std::shared_ptr<const GeometryCollection> collection) : source_(std::move(collection)) {}
        GeometrySpec(GeometryCollection collection)
            : source_(std::make_shared<const GeometryCollection>(std::move(collection))) {}

        const Source &source() const { return source_; }
        bool is_path() const { return std::holds_alternative<std::filesystem::path>(source_); }
        const std::optional<std::string> &name() const { return name_; }
        const std::optional<Predicate> &where() const { return where_; }
        const std::optional<BufferOptions> &buffer() const { return buffer_; }
        const std::optional<std::vector<std::string>> &keep_attributes() const { return keep_attributes_; }

        /// Copy with a display name used in logs and error labels
        GeometrySpec with_name(std::string name) const {
            GeometrySpec copy = *this;
            copy.name_ = std::move(name);
            return copy;
        }

        GeometrySpec with_where(Predicate predicate) const {
            GeometrySpec copy = *this;
            copy.where_ = std::move(predicate);
            return copy;
        }

        /// @throws InvalidFilterError if the query does not parse
        GeometrySpec with_where(const std::string &query) const { return with_where(Predicate::parse(query)); }

        GeometrySpec with_buffer(BufferOptions options) const {
            GeometrySpec copy = *this;
            copy.buffer_ = options;
            return copy;
        }

        GeometrySpec with_buffer(double distance) const { return with_buffer(BufferOptions(distance)); }

        GeometrySpec with_keep_attributes(std::vector<std::string> names) const {
            GeometrySpec copy = *this;
            copy.keep_attributes_ = std::move(names);
            return copy;
        }

        /// Path text, or "<memory>" for in-memory sources
        std::string describe_source() const {
            if (const auto *path = std::get_if<std::filesystem::path>(&source_))
                return path->string();
            return "<memory>";
        }

      private:
        Source source_;
        std::optional<std::string> name_;
        std::optional<Predicate> where_;
        std::optional<BufferOptions> buffer_;
        std::optional<std::vector<std::string>> keep_attributes_;
    };

} // namespace eligix
