#include "eligix/combine.hpp"

#include <string>
#include <utility>

#include "eligix/errors.hpp"
#include "eligix/utils/utils.hpp"

namespace eligix {

    namespace {

        // The overlay kernel does not throw on degenerate operands, it returns garbage
        void check_operand(const char *name, const BMultiPolygon &operand) {
            std::string message;
            if (!bg::is_valid(operand, message))
                throw GeometryOperationError(std::string(name) + " failed: " + message);
        }

        template <typename Overlay>
        BMultiPolygon run_overlay(const char *name, const BMultiPolygon &lhs, const BMultiPolygon &rhs,
                                  Overlay &&overlay) {
            check_operand(name, lhs);
            check_operand(name, rhs);
            BMultiPolygon out;
            try {
                overlay(out);
            } catch (const std::exception &e) {
                throw GeometryOperationError(std::string(name) + " failed: " + e.what());
            }
            return out;
        }

    } // namespace

    BMultiPolygon unite(const BMultiPolygon &lhs, const BMultiPolygon &rhs) {
        if (lhs.empty())
            return rhs;
        if (rhs.empty())
            return lhs;
        return run_overlay("union", lhs, rhs, [&](BMultiPolygon &out) { bg::union_(lhs, rhs, out); });
    }

    BMultiPolygon subtract(const BMultiPolygon &lhs, const BMultiPolygon &rhs) {
        if (lhs.empty() || rhs.empty())
            return lhs;
        return run_overlay("difference", lhs, rhs, [&](BMultiPolygon &out) { bg::difference(lhs, rhs, out); });
    }

    BMultiPolygon intersect(const BMultiPolygon &lhs, const BMultiPolygon &rhs) {
        if (lhs.empty() || rhs.empty())
            return {};
        return run_overlay("intersection", lhs, rhs, [&](BMultiPolygon &out) { bg::intersection(lhs, rhs, out); });
    }

    BMultiPolygon dissolve(const std::vector<BMultiPolygon> &parts) {
        std::vector<BMultiPolygon> level;
        level.reserve(parts.size());
        for (const auto &part : parts) {
            if (!part.empty())
                level.push_back(part);
        }
        if (level.empty())
            return {};

        while (level.size() > 1) {
            std::vector<BMultiPolygon> next;
            next.reserve((level.size() + 1) / 2);
            for (std::size_t i = 0; i < level.size(); i += 2) {
                if (i + 1 < level.size())
                    next.push_back(unite(level[i], level[i + 1]));
                else
                    next.push_back(std::move(level[i]));
            }
            level = std::move(next);
        }
        return level.front();
    }

    BMultiPolygon region_of(const std::vector<GeometryCollection> &collections, const ReferenceSystem &crs) {
        std::vector<BMultiPolygon> parts;
        for (const auto &collection : collections) {
            if (collection.crs() != crs) {
                throw CRSResolutionError("cannot combine a collection in " +
                                         (collection.crs().determined() ? collection.crs().identifier()
                                                                        : std::string("<undetermined>")) +
                                         " with " + crs.identifier());
            }
            for (const auto &feature : collection) {
                if (!is_polygonal(feature.geometry))
                    continue;
                auto part = utils::polygonal_part(feature.geometry);
                if (!part.empty())
                    parts.push_back(std::move(part));
            }
        }
        return dissolve(parts);
    }

    GeometryCollection unite(const std::vector<GeometryCollection> &collections, const ReferenceSystem &crs) {
        return to_collection(region_of(collections, crs), crs);
    }

} // namespace eligix
