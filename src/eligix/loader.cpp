#include "eligix/loader.hpp"

#include "eligix/errors.hpp"

namespace eligix {

    void CatalogLoader::add(const std::filesystem::path &path, GeometryCollection collection) {
        catalog_[path.lexically_normal()] = std::make_shared<const GeometryCollection>(std::move(collection));
    }

    bool CatalogLoader::contains(const std::filesystem::path &path) const {
        return catalog_.count(path.lexically_normal()) > 0;
    }

    GeometryCollection CatalogLoader::load(const GeometrySpec &spec, const ReferenceSystem &target) const {
        std::shared_ptr<const GeometryCollection> source;

        if (spec.is_path()) {
            const auto &path = std::get<std::filesystem::path>(spec.source());
            auto it = catalog_.find(path.lexically_normal());
            if (it == catalog_.end())
                throw LayerResolutionError("no collection registered for path '" + path.string() + "'");
            source = it->second;
        } else {
            source = std::get<std::shared_ptr<const GeometryCollection>>(spec.source());
        }

        if (!source)
            throw LayerResolutionError("layer source is empty");
        if (!source->crs().determined())
            throw CRSResolutionError("reference system of " + spec.describe_source() + " is undetermined");
        if (!can_reproject(source->crs(), target))
            throw CRSResolutionError("cannot reproject " + spec.describe_source() + " from " +
                                     source->crs().identifier() + " to " +
                                     (target.determined() ? target.identifier() : std::string("<undetermined>")));

        return normalized(source->reprojected(target), spec.name().value_or(spec.describe_source()));
    }

} // namespace eligix
