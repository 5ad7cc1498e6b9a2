#include "site_pipeline.h"

#include <exception>
#include <filesystem>
#include <system_error>

#include "csv_tables.h"
#include "geojson_export.h"
#include "reference_join.h"

namespace fs = std::filesystem;

PipelineConfig config_for_data_dir(const std::string &dir) {
    fs::path d(dir);
    PipelineConfig cfg;
    cfg.sitesCSV         = (d / "sites.csv").string();
    cfg.mineralsCSV      = (d / "minerals.csv").string();
    cfg.extraMineralsCSV = (d / "extra_minerals.csv").string();
    cfg.countriesCSV     = (d / "countries.csv").string();
    cfg.productionCSV    = (d / "production_stats.csv").string();
    return cfg;
}

void print_stage_summary(const std::vector<StageSummary> &summaries, std::ostream &out) {
    out << "\n--- Pipeline Summary ---\n";
    for (const auto &s : summaries) {
        out << s.stageName << ": " << s.recordCount << " records, "
            << s.flaggedCount << " flagged, took " << s.durationSeconds << " seconds";
        if (s.skipped)
            out << " (SKIPPED)";
        out << "\n";
    }
    out.flush();
}

static bool optional_table_present(const std::string &path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

PipelineInputs load_pipeline_inputs(const PipelineConfig &cfg, std::ostream &err) {
    PipelineInputs in;
    try {
        in.minerals = loadMineralsCSV(cfg.mineralsCSV, cfg.verbose);
    } catch (const std::exception &e) {
        err << "Error loading minerals: " << e.what() << std::endl;
    }
    if (optional_table_present(cfg.extraMineralsCSV)) {
        try {
            auto extra = loadMineralsCSV(cfg.extraMineralsCSV, cfg.verbose);
            in.minerals.insert(in.minerals.end(), extra.begin(), extra.end());
        } catch (const std::exception &e) {
            err << "Error loading extra minerals: " << e.what() << std::endl;
        }
    }
    try {
        in.countries = loadCountriesCSV(cfg.countriesCSV, cfg.verbose);
    } catch (const std::exception &e) {
        err << "Error loading countries: " << e.what() << std::endl;
    }
    if (optional_table_present(cfg.productionCSV)) {
        try {
            in.productionRows = loadProductionCSV(cfg.productionCSV, cfg.verbose);
        } catch (const std::exception &e) {
            err << "Error loading production: " << e.what() << std::endl;
        }
    }
    try {
        in.siteRows = loadSitesCSV(cfg.sitesCSV, cfg.verbose);
    } catch (const std::exception &e) {
        err << "Error loading sites: " << e.what() << std::endl;
    }
    return in;
}

CentroidTable load_centroid_table(const PipelineConfig &cfg, std::ostream &err) {
    try {
        if (!cfg.countryShapefile.empty())
            return loadCentroidsShapefile(cfg.countryShapefile, cfg.shapefileNameField, cfg.verbose);
        if (!cfg.centroidsCSV.empty())
            return loadCentroidsCSV(cfg.centroidsCSV, cfg.verbose);
    } catch (const std::exception &e) {
        err << "Error loading centroids: " << e.what()
            << " (using built-in centroids)" << std::endl;
    }
    return default_centroids();
}

PipelineResult run_site_pipeline(const PipelineInputs &inputs,
                                 const CoordinateValidator &validator,
                                 const PipelineConfig &cfg,
                                 std::ostream &out,
                                 std::ostream &err) {
    PipelineResult result;
    const bool verbose = cfg.verbose;

    std::vector<SiteRecord> joined;
    {
        auto [res, dur] = measureDuration([&] {
            return join_sites(inputs.siteRows, inputs.minerals, inputs.countries, verbose);
        });
        joined = std::move(res);
        size_t unresolved = 0;
        for (const auto &s : joined)
            if (!s.countryName || !s.mineralName) ++unresolved;
        result.summaries.push_back({"join_sites", joined.size(), unresolved, false, dur});
    }
    {
        auto timedPass = measureDuration([&] {
            return cc_latlon(joined, validator, verbose);
        });
        CorrectionPass &pass = timedPass.first;
        result.summaries.push_back({"cc_latlon", pass.sites.size(), pass.log.size(), false,
                                    timedPass.second});

        auto [audit, sinkDur] = measureDuration([&] {
            SinkOptions opts;
            opts.inputPath = cfg.sitesCSV;
            opts.outputPath = cfg.outputCSV;
            opts.verbose = verbose;
            return publish_corrections(pass, opts, out, err);
        });
        result.audit = std::move(audit);
        result.summaries.push_back({"export_csv", pass.sites.size(),
                                    result.audit.csv.attempted && !result.audit.csv.ok ? 1u : 0u,
                                    !result.audit.csv.attempted, sinkDur});

        result.sites = std::move(pass.sites);
        result.log = std::move(pass.log);
    }
    if (!cfg.geojsonPath.empty()) {
        auto [status, dur] = measureDuration([&] {
            return export_sites_geojson(result.sites, cfg.geojsonPath, cfg.sitesCSV);
        });
        result.geojson = std::move(status);
        if (result.geojson.ok) {
            if (verbose) out << result.geojson.message << std::endl;
        } else {
            err << "warning: failed to write GeoJSON: " << result.geojson.message << std::endl;
        }
        result.summaries.push_back({"export_geojson", result.sites.size(),
                                    result.geojson.ok ? 0u : 1u, false, dur});
    } else {
        result.summaries.push_back({"export_geojson", result.sites.size(), 0, true, 0.0});
    }
    {
        auto [prod, dur] = measureDuration([&] {
            return join_production(inputs.productionRows, inputs.minerals, inputs.countries, verbose);
        });
        size_t unresolved = 0;
        for (const auto &p : prod)
            if (!p.countryName || !p.mineralName) ++unresolved;
        result.summaries.push_back({"join_production", prod.size(), unresolved,
                                    inputs.productionRows.empty(), dur});
        result.production = std::move(prod);
    }
    return result;
}
