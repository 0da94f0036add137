#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "eligix/collection.hpp"
#include "eligix/crs.hpp"
#include "eligix/loader.hpp"
#include "eligix/spec.hpp"
#include "eligix/types.hpp"

namespace eligix {

    /**
     * @brief Precedence between restricted and excluded layers
     *
     * With OverridesExclusion a restricted area inside an exclusion is still
     * reported in eligible_with_restrictions, so that output may hold land that
     * an excluded layer removes from the eligible output.
     */
    enum class RestrictionOrder {
        AfterExclusion,     ///< Restriction is taken from the final eligible area
        OverridesExclusion, ///< Restriction is taken from the whole candidate area, excluded land included
    };

    struct AnalysisConfig {
        ReferenceSystem crs;
        std::optional<double> sliver_threshold;
        RestrictionOrder restriction_order = RestrictionOrder::AfterExclusion;
        bool parallel = true;
        std::size_t max_workers = 0; ///< 0 uses the hardware concurrency
        bool verbose = false;
    };

    /**
     * @brief Layers of one analysis
     *
     * The base area's where and buffer are not applied.
     */
    struct AnalysisInput {
        GeometrySpec base_area;
        std::vector<GeometrySpec> included;
        std::vector<GeometrySpec> excluded;
        std::vector<GeometrySpec> restricted;
    };

    /**
     * @brief Result of an analysis, one attribute-less feature per polygon
     *
     * Both collections are in the configured reference system and never overlap.
     */
    struct AnalysisOutput {
        GeometryCollection eligible;
        GeometryCollection eligible_with_restrictions;
    };

    /// Intermediate regions of the precedence algebra
    struct EligibilityRegions {
        BMultiPolygon candidate;
        BMultiPolygon eligible;
        BMultiPolygon restricted;
    };

    /**
     * @brief Combine the aggregated regions
     *
     * candidate = base + included
     * raw       = candidate - (excluded - included)
     *
     * AfterExclusion:     restricted = raw & restricted,       eligible = raw - restricted
     * OverridesExclusion: restricted = candidate & restricted, eligible = raw - restricted
     */
    EligibilityRegions apply_precedence(const BMultiPolygon &base, const BMultiPolygon &included,
                                        const BMultiPolygon &excluded, const BMultiPolygon &restricted,
                                        RestrictionOrder order = RestrictionOrder::AfterExclusion);

    /**
     * @brief Label identifying a layer in logs and errors
     *
     * "included[2]", or "included[2] 'wetlands'" when the spec is named.
     */
    std::string layer_label(const std::string &group, std::size_t index, const GeometrySpec &spec);

    /**
     * @brief One eligibility analysis run
     *
     * Stages run in a fixed order: validate the configuration, load every layer,
     * filter and buffer the layers (in parallel when configured), aggregate them
     * per kind, apply the precedence algebra against the base area and finally
     * remove slivers. Any failure aborts the run and is reported as an
     * eligix::Error tagged with the offending layer.
     */
    class EligibilityAnalysis {
      public:
        EligibilityAnalysis(AnalysisInput input, AnalysisConfig config,
                            std::shared_ptr<const LayerLoader> loader = std::make_shared<CatalogLoader>());

        const AnalysisInput &input() const { return input_; }
        const AnalysisConfig &config() const { return config_; }

        AnalysisOutput execute() const;

      private:
        AnalysisInput input_;
        AnalysisConfig config_;
        std::shared_ptr<const LayerLoader> loader_;
    };

    /// EligibilityAnalysis(input, config, loader).execute()
    AnalysisOutput run_analysis(const AnalysisInput &input, const AnalysisConfig &config,
                                std::shared_ptr<const LayerLoader> loader = std::make_shared<CatalogLoader>());

} // namespace eligix
