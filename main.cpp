#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

// GDAL drivers (shapefile centroids, GeoJSON export)
#include "gdal_priv.h"

#include "coordinate_validator.h"
#include "site_pipeline.h"

void segfault_handler(int signum) {
    std::cerr << "segmentation fault (signal " << signum << ") occurred." << std::endl;
    std::exit(signum);
}

static void usage(const char *argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --data-dir DIR            directory holding sites.csv, minerals.csv,\n"
              << "                            extra_minerals.csv, countries.csv, production_stats.csv\n"
              << "  --sites FILE              site table (default DIR/sites.csv)\n"
              << "  --out FILE                corrected table (default sites_fixed.csv beside --sites)\n"
              << "  --centroids FILE          country centroid csv (name, centroid.lat, centroid.lon)\n"
              << "  --country-shapefile SHP   derive centroids from country polygons\n"
              << "  --name-field FIELD        country name attribute in SHP (default NAME)\n"
              << "  --geojson FILE            also write corrected sites as GeoJSON\n"
              << "  --quiet                   only print errors and warnings\n";
}

// --------------------
// Main Function
// --------------------
int main(int argc, char **argv) {
    std::signal(SIGSEGV, segfault_handler);

    PipelineConfig cfg;
    std::string sitesOverride;
    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        auto next = [&](std::string &dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        std::string value;
        bool ok = true;
        if (std::strcmp(arg, "--data-dir") == 0) {
            if ((ok = next(value))) {
                PipelineConfig dirCfg = config_for_data_dir(value);
                dirCfg.outputCSV          = cfg.outputCSV;
                dirCfg.centroidsCSV       = cfg.centroidsCSV;
                dirCfg.countryShapefile   = cfg.countryShapefile;
                dirCfg.shapefileNameField = cfg.shapefileNameField;
                dirCfg.geojsonPath        = cfg.geojsonPath;
                dirCfg.verbose            = cfg.verbose;
                cfg = dirCfg;
            }
        } else if (std::strcmp(arg, "--sites") == 0) {
            ok = next(sitesOverride);
        } else if (std::strcmp(arg, "--out") == 0) {
            ok = next(cfg.outputCSV);
        } else if (std::strcmp(arg, "--centroids") == 0) {
            ok = next(cfg.centroidsCSV);
        } else if (std::strcmp(arg, "--country-shapefile") == 0) {
            ok = next(cfg.countryShapefile);
        } else if (std::strcmp(arg, "--name-field") == 0) {
            ok = next(cfg.shapefileNameField);
        } else if (std::strcmp(arg, "--geojson") == 0) {
            ok = next(cfg.geojsonPath);
        } else if (std::strcmp(arg, "--quiet") == 0) {
            cfg.verbose = false;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            std::cerr << "unknown option: " << arg << "\n";
            ok = false;
        }
        if (!ok) {
            usage(argv[0]);
            return 1;
        }
    }
    if (!sitesOverride.empty())
        cfg.sitesCSV = sitesOverride;

    GDALAllRegister();

    auto overallStart = std::chrono::steady_clock::now();

    PipelineInputs inputs = load_pipeline_inputs(cfg);
    CoordinateValidator validator(load_centroid_table(cfg));
    if (cfg.verbose) {
        std::cout << "validating against " << validator.centroids().size()
                  << " country centroids" << std::endl;
    }

    PipelineResult result = run_site_pipeline(inputs, validator, cfg);

    auto overallEnd = std::chrono::steady_clock::now();
    std::chrono::duration<double> overallDur = overallEnd - overallStart;

    if (cfg.verbose) {
        print_stage_summary(result.summaries, std::cout);
        std::cout << "Overall: " << result.sites.size() << " sites, "
                  << result.log.count(CorrectionAction::SwapLatLon) << " swapped, "
                  << result.log.count(CorrectionAction::Mismatch) << " left for manual review.\n";
        std::cout << "Total time: " << overallDur.count() << " seconds" << std::endl;
    }
    return 0;
}
