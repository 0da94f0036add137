#pragma once

#include <string>

#include <datapod/datapod.hpp>

#include "eligix/types.hpp"

namespace eligix {

    /**
     * @brief Identifier of the coordinate system geometries are expressed in
     *
     * Supported identifiers:
     * - "EPSG:4326" (aliases "WGS84", "WGS"): geographic, x = longitude, y = latitude, degrees
     * - "ENU:<lat>,<lon>[,<alt>]": local east-north-up plane in metres around a datum
     * - "LOCAL:<name>": engineering plane, only compatible with itself
     *
     * A default constructed system is undetermined and cannot take part in any
     * geometric operation.
     */
    class ReferenceSystem {
      public:
        enum class Kind { Undetermined, Geographic, LocalTangent, Engineering };

        ReferenceSystem() = default;

        /// @throws CRSResolutionError for unknown or malformed identifiers
        static ReferenceSystem parse(const std::string &identifier);

        static ReferenceSystem wgs84();
        static ReferenceSystem enu(const datapod::Geo &datum);
        static ReferenceSystem local(const std::string &name);

        Kind kind() const { return kind_; }
        bool determined() const { return kind_ != Kind::Undetermined; }
        bool is_geographic() const { return kind_ == Kind::Geographic; }

        /// Canonical identifier, empty when undetermined
        const std::string &identifier() const { return identifier_; }

        /// Anchor of a LocalTangent system
        const datapod::Geo &datum() const { return datum_; }

        bool operator==(const ReferenceSystem &other) const { return identifier_ == other.identifier_; }
        bool operator!=(const ReferenceSystem &other) const { return !(*this == other); }

      private:
        Kind kind_ = Kind::Undetermined;
        std::string identifier_;
        datapod::Geo datum_{};
    };

    /// Whether coordinates can be carried from one system to the other
    bool can_reproject(const ReferenceSystem &from, const ReferenceSystem &to);

    /**
     * @brief Transform a geometry's coordinates in place
     *
     * Geographic and local tangent systems convert through WGS84 using concord.
     * Engineering systems only convert to themselves.
     *
     * @throws CRSResolutionError if either system is undetermined, the pair is not
     *         convertible, or a coordinate leaves the valid domain
     */
    void reproject(Geometry &geometry, const ReferenceSystem &from, const ReferenceSystem &to);

} // namespace eligix
