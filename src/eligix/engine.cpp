#include "eligix/engine.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "eligix/combine.hpp"
#include "eligix/errors.hpp"
#include "eligix/preprocess.hpp"
#include "eligix/sliver.hpp"

namespace eligix {

    namespace {

        enum class LayerKind { Included, Excluded, Restricted };

        struct Layer {
            LayerKind kind;
            std::string label;
            const GeometrySpec *spec;
            GeometryCollection collection;
        };

        void log_stage(bool verbose, const std::string &message) {
            if (!verbose)
                return;
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::cout << "[" << std::put_time(std::localtime(&now), "%H:%M:%S") << "] " << message << std::endl;
        }

        GeometryCollection process_layer(const Layer &layer) {
            try {
                return process(layer.collection, *layer.spec);
            } catch (Error &e) {
                e.set_layer(layer.label);
                throw;
            }
        }

        // Results come back in input order; a failure surfaces once every earlier
        // layer has completed, so the first failing layer is the one reported.
        std::vector<GeometryCollection> process_layers(const std::vector<Layer> &layers, bool parallel,
                                                       std::size_t max_workers) {
            std::vector<GeometryCollection> out;
            out.reserve(layers.size());

            if (!parallel || layers.size() < 2) {
                for (const auto &layer : layers)
                    out.push_back(process_layer(layer));
                return out;
            }

            std::size_t workers = max_workers;
            if (workers == 0)
                workers = std::max(1u, std::thread::hardware_concurrency());

            for (std::size_t first = 0; first < layers.size(); first += workers) {
                std::size_t last = std::min(first + workers, layers.size());
                std::vector<std::future<GeometryCollection>> batch;
                batch.reserve(last - first);
                for (std::size_t i = first; i < last; ++i)
                    batch.push_back(std::async(std::launch::async, process_layer, std::cref(layers[i])));
                for (auto &task : batch)
                    out.push_back(task.get());
            }
            return out;
        }

    } // namespace

    EligibilityRegions apply_precedence(const BMultiPolygon &base, const BMultiPolygon &included,
                                        const BMultiPolygon &excluded, const BMultiPolygon &restricted,
                                        RestrictionOrder order) {
        EligibilityRegions regions;
        regions.candidate = unite(base, included);
        BMultiPolygon effective_exclusion = subtract(excluded, included);
        BMultiPolygon raw = subtract(regions.candidate, effective_exclusion);

        if (order == RestrictionOrder::AfterExclusion) {
            regions.restricted = intersect(raw, restricted);
            regions.eligible = subtract(raw, regions.restricted);
        } else {
            regions.restricted = intersect(regions.candidate, restricted);
            regions.eligible = subtract(raw, restricted);
        }
        return regions;
    }

    std::string layer_label(const std::string &group, std::size_t index, const GeometrySpec &spec) {
        std::string label = group + "[" + std::to_string(index) + "]";
        if (spec.name())
            label += " '" + *spec.name() + "'";
        return label;
    }

    EligibilityAnalysis::EligibilityAnalysis(AnalysisInput input, AnalysisConfig config,
                                             std::shared_ptr<const LayerLoader> loader)
        : input_(std::move(input)), config_(std::move(config)), loader_(std::move(loader)) {
        if (!loader_)
            throw std::invalid_argument("EligibilityAnalysis requires a loader");
    }

    AnalysisOutput EligibilityAnalysis::execute() const {
        const ReferenceSystem &crs = config_.crs;
        const bool verbose = config_.verbose;

        if (!crs.determined())
            throw CRSResolutionError("analysis reference system is undetermined");
        if (config_.sliver_threshold)
            validate_threshold(*config_.sliver_threshold);

        // Normalize
        log_stage(verbose, "Start loading layers into " + crs.identifier());
        auto load = [&](const std::string &label, const GeometrySpec &spec) {
            try {
                GeometryCollection result = loader_->load(spec, crs);
                if (result.crs() != crs) {
                    throw CRSResolutionError("loader returned " + spec.describe_source() + " in " +
                                             (result.crs().determined() ? result.crs().identifier()
                                                                        : std::string("<undetermined>")) +
                                             " instead of " + crs.identifier());
                }
                return result;
            } catch (Error &e) {
                e.set_layer(label);
                throw;
            }
        };

        std::string base_label = "base";
        if (input_.base_area.name())
            base_label += " '" + *input_.base_area.name() + "'";
        if (input_.base_area.where() || input_.base_area.buffer())
            std::cerr << "Warning: " << base_label << " where/buffer are ignored" << std::endl;
        GeometryCollection base = load(base_label, input_.base_area);

        std::vector<Layer> layers;
        auto add_group = [&](LayerKind kind, const std::string &group, const std::vector<GeometrySpec> &specs) {
            for (std::size_t i = 0; i < specs.size(); ++i) {
                std::string label = layer_label(group, i, specs[i]);
                layers.push_back(Layer{kind, label, &specs[i], load(label, specs[i])});
            }
        };
        add_group(LayerKind::Included, "included", input_.included);
        add_group(LayerKind::Excluded, "excluded", input_.excluded);
        add_group(LayerKind::Restricted, "restricted", input_.restricted);

        // Preprocess
        log_stage(verbose, "Start preparing " + std::to_string(layers.size()) + " layers");
        std::vector<GeometryCollection> processed = process_layers(layers, config_.parallel, config_.max_workers);

        // Aggregate
        log_stage(verbose, "Start aggregating layers");
        std::vector<GeometryCollection> included, excluded, restricted;
        for (std::size_t i = 0; i < layers.size(); ++i) {
            switch (layers[i].kind) {
            case LayerKind::Included:
                included.push_back(std::move(processed[i]));
                break;
            case LayerKind::Excluded:
                excluded.push_back(std::move(processed[i]));
                break;
            case LayerKind::Restricted:
                restricted.push_back(std::move(processed[i]));
                break;
            }
        }
        BMultiPolygon base_region = region_of({base}, crs);
        BMultiPolygon included_region = region_of(included, crs);
        BMultiPolygon excluded_region = region_of(excluded, crs);
        BMultiPolygon restricted_region = region_of(restricted, crs);

        // Algebra
        log_stage(verbose, "Start computing eligible areas");
        EligibilityRegions regions = apply_precedence(base_region, included_region, excluded_region,
                                                      restricted_region, config_.restriction_order);

        // Slivers
        log_stage(verbose, "Start removing slivers");
        AnalysisOutput output{remove_slivers(to_collection(regions.eligible, crs), config_.sliver_threshold),
                              remove_slivers(to_collection(regions.restricted, crs), config_.sliver_threshold)};

        log_stage(verbose, "Done: eligible " + std::to_string(output.eligible.area()) + ", with restrictions " +
                               std::to_string(output.eligible_with_restrictions.area()));
        return output;
    }

    AnalysisOutput run_analysis(const AnalysisInput &input, const AnalysisConfig &config,
                                std::shared_ptr<const LayerLoader> loader) {
        return EligibilityAnalysis(input, config, std::move(loader)).execute();
    }

} // namespace eligix
