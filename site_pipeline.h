#pragma once
#include <chrono>
#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "audit_sink.h"
#include "cc_latlon.h"
#include "centroid_table.h"
#include "coordinate_validator.h"
#include "correction_log.h"
#include "site_records.h"

// --------------------
// Configuration
// --------------------
struct PipelineConfig {
    std::string sitesCSV         = "data/sites.csv";
    std::string mineralsCSV      = "data/minerals.csv";
    std::string extraMineralsCSV = "data/extra_minerals.csv";   // optional
    std::string countriesCSV     = "data/countries.csv";
    std::string productionCSV    = "data/production_stats.csv"; // optional
    std::string outputCSV;            // empty: sites_fixed.csv beside sitesCSV
    std::string centroidsCSV;         // empty: built-in centroids
    std::string countryShapefile;     // takes precedence over centroidsCSV
    std::string shapefileNameField = "NAME";
    std::string geojsonPath;          // empty: no GeoJSON export
    bool        verbose = true;
};

// Default file names inside `dir`.
PipelineConfig config_for_data_dir(const std::string &dir);

// --------------------
// Timing Helper Template
// --------------------
template<typename F, typename... Args>
auto measureDuration(F func, Args&&... args)
    -> std::pair<decltype(func(std::forward<Args>(args)...)), double> {
    auto start = std::chrono::steady_clock::now();
    auto result = func(std::forward<Args>(args)...);
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    return {result, elapsed.count()};
}

struct StageSummary {
    std::string stageName;
    size_t      recordCount;
    size_t      flaggedCount;
    bool        skipped;
    double      durationSeconds;
};

void print_stage_summary(const std::vector<StageSummary> &summaries, std::ostream &out);

// --------------------
// Inputs
// --------------------
struct PipelineInputs {
    std::vector<RawSiteRow>       siteRows;
    std::vector<MineralRef>       minerals;   // minerals.csv then extra_minerals.csv
    std::vector<CountryRef>       countries;
    std::vector<RawProductionRow> productionRows;
};

// A table that fails to load is reported on `err` and left empty.
PipelineInputs load_pipeline_inputs(const PipelineConfig &cfg, std::ostream &err = std::cerr);

// Shapefile, then centroid csv, then the built-in table. A source that fails
// to load is reported on `err` and the built-in table is used.
CentroidTable load_centroid_table(const PipelineConfig &cfg, std::ostream &err = std::cerr);

// --------------------
// Run
// --------------------
struct PipelineResult {
    std::vector<SiteRecord>       sites;        // corrected, input order
    std::vector<ProductionRecord> production;
    CorrectionLog                 log;
    AuditReport                   audit;
    ExportStatus                  geojson;
    std::vector<StageSummary>     summaries;
};

/*
 * run_site_pipeline: join -> validate -> correct -> log/export.
 * Every call returns its own log; nothing is kept between runs.
 */
PipelineResult run_site_pipeline(const PipelineInputs &inputs,
                                 const CoordinateValidator &validator,
                                 const PipelineConfig &cfg,
                                 std::ostream &out = std::cout,
                                 std::ostream &err = std::cerr);
