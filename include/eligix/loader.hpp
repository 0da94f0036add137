#pragma once

#include <filesystem>
#include <map>
#include <memory>

#include "eligix/collection.hpp"
#include "eligix/crs.hpp"
#include "eligix/spec.hpp"

namespace eligix {

    /**
     * @brief Resolves a layer specification into a normalized collection
     *
     * Implementations own all I/O. The engine calls load() once per layer, from
     * one thread, and expects the result in the requested reference system with
     * only valid, non-empty geometries.
     */
    class LayerLoader {
      public:
        virtual ~LayerLoader() = default;

        /**
         * @throws LayerResolutionError if the source cannot be resolved
         * @throws CRSResolutionError if the source's system is undetermined or not
         *         convertible to target
         */
        virtual GeometryCollection load(const GeometrySpec &spec, const ReferenceSystem &target) const = 0;
    };

    /**
     * @brief Loader for in-memory sources and pre-registered paths
     *
     * In-memory sources are used as they are. Path sources are looked up in a
     * catalog filled by the caller, which keeps file parsing outside the library.
     */
    class CatalogLoader : public LayerLoader {
      public:
        CatalogLoader() = default;

        /// Register the collection served for a path source
        void add(const std::filesystem::path &path, GeometryCollection collection);

        bool contains(const std::filesystem::path &path) const;

        GeometryCollection load(const GeometrySpec &spec, const ReferenceSystem &target) const override;

      private:
        std::map<std::filesystem::path, std::shared_ptr<const GeometryCollection>> catalog_;
    };

} // namespace eligix
