#include <gtest/gtest.h>

#include <sstream>

#include "site_pipeline.h"
#include "test_support.h"

namespace {

void write_reference_tables(const ScratchDir &dir) {
    write_file(dir.file("minerals.csv"),
               "MineralID,MineralName,Description\n"
               "1,Cobalt,Battery metal\n"
               "2,Copper,Conductor\n"
               "3,Uranium,Fuel\n");
    write_file(dir.file("countries.csv"),
               "CountryID,CountryName\n"
               "1,DRC (Congo)\n"
               "2,South Africa\n"
               "3,Namibia\n"
               "4,Zambia\n");
}

void write_sites(const ScratchDir &dir) {
    write_file(dir.file("sites.csv"),
               "SiteID,SiteName,MineralID,CountryID,Latitude,Longitude,Production_tonnes\n"
               "1,Swapped Mine,2,2,22.94,-30.56,1200\n"
               "2,Far Mine,3,3,5,5,300\n"
               "3,Fine Mine,1,1,-4.0,21.8,9000\n"
               "4,Unchecked Mine,2,4,-13.1,27.8,400\n"
               "5,Broken Mine,2,2,n/a,22.9,10\n");
}

PipelineConfig quiet_config(const ScratchDir &dir) {
    PipelineConfig cfg = config_for_data_dir(dir.path().string());
    cfg.verbose = false;
    return cfg;
}

} // namespace

TEST(ConfigForDataDir, UsesDefaultFileNames) {
    PipelineConfig cfg = config_for_data_dir("/data");
    EXPECT_EQ(cfg.sitesCSV, "/data/sites.csv");
    EXPECT_EQ(cfg.mineralsCSV, "/data/minerals.csv");
    EXPECT_EQ(cfg.extraMineralsCSV, "/data/extra_minerals.csv");
    EXPECT_EQ(cfg.countriesCSV, "/data/countries.csv");
    EXPECT_EQ(cfg.productionCSV, "/data/production_stats.csv");
    EXPECT_TRUE(cfg.outputCSV.empty());
    EXPECT_TRUE(cfg.geojsonPath.empty());
}

TEST(LoadPipelineInputs, ExtraMineralsAreAppended) {
    ScratchDir dir;
    write_reference_tables(dir);
    write_sites(dir);
    write_file(dir.file("extra_minerals.csv"), "MineralID,MineralName\n9,Lithium\n");
    std::ostringstream err;
    PipelineInputs in = load_pipeline_inputs(quiet_config(dir), err);
    EXPECT_TRUE(err.str().empty()) << err.str();
    ASSERT_EQ(in.minerals.size(), 4u);
    EXPECT_EQ(in.minerals[3].name, "Lithium");
    EXPECT_EQ(in.countries.size(), 4u);
    EXPECT_EQ(in.siteRows.size(), 5u);
    EXPECT_TRUE(in.productionRows.empty());
}

TEST(LoadPipelineInputs, MissingTablesAreReportedAndLeftEmpty) {
    ScratchDir dir;
    std::ostringstream err;
    PipelineInputs in = load_pipeline_inputs(quiet_config(dir), err);
    EXPECT_TRUE(in.siteRows.empty());
    EXPECT_TRUE(in.minerals.empty());
    EXPECT_NE(err.str().find("Error loading sites:"), std::string::npos);
    EXPECT_NE(err.str().find("Error loading minerals:"), std::string::npos);
    EXPECT_NE(err.str().find("Error loading countries:"), std::string::npos);
    // optional tables are not reported when absent
    EXPECT_EQ(err.str().find("extra minerals"), std::string::npos);
    EXPECT_EQ(err.str().find("production"), std::string::npos);
}

TEST(LoadCentroidTable, FallsBackToBuiltInTable) {
    ScratchDir dir;
    PipelineConfig cfg = quiet_config(dir);
    std::ostringstream err;
    EXPECT_EQ(load_centroid_table(cfg, err).size(), 4u);
    EXPECT_TRUE(err.str().empty());

    cfg.centroidsCSV = dir.file("missing_centroids.csv");
    CentroidTable t = load_centroid_table(cfg, err);
    EXPECT_EQ(t.size(), 4u);
    EXPECT_NE(err.str().find("Error loading centroids:"), std::string::npos);
}

TEST(LoadCentroidTable, CsvSourceReplacesBuiltInTable) {
    ScratchDir dir;
    write_file(dir.file("centroids.csv"), "name,centroid.lat,centroid.lon\nZambia,-13.13,27.85\n");
    PipelineConfig cfg = quiet_config(dir);
    cfg.centroidsCSV = dir.file("centroids.csv");
    std::ostringstream err;
    CentroidTable t = load_centroid_table(cfg, err);
    EXPECT_EQ(t.size(), 1u);
    EXPECT_NE(t.find("Zambia"), nullptr);
}

TEST(RunSitePipeline, CorrectsFlagsAndExports) {
    ScratchDir dir;
    write_reference_tables(dir);
    write_sites(dir);
    write_file(dir.file("production_stats.csv"),
               "MineralID,CountryID,Year,Production_tonnes\n1,1,2020,80000\n");
    PipelineConfig cfg = quiet_config(dir);
    std::ostringstream out, err;
    PipelineInputs in = load_pipeline_inputs(cfg, err);
    CoordinateValidator validator(load_centroid_table(cfg, err));
    PipelineResult r = run_site_pipeline(in, validator, cfg, out, err);

    ASSERT_EQ(r.sites.size(), 5u);
    EXPECT_DOUBLE_EQ(r.sites[0].lat, -30.56);
    EXPECT_DOUBLE_EQ(r.sites[0].lon, 22.94);
    EXPECT_DOUBLE_EQ(r.sites[1].lat, 5.0);
    EXPECT_NE(r.sites[1].note.find("manual review"), std::string::npos);
    EXPECT_TRUE(r.sites[2].note.empty());
    EXPECT_TRUE(r.sites[3].note.empty());
    EXPECT_FALSE(r.sites[4].has_valid_coordinates());
    EXPECT_EQ(r.sites[4].latText, "n/a");

    ASSERT_EQ(r.log.size(), 2u);
    EXPECT_EQ(r.log[0].siteID, "1");
    EXPECT_EQ(r.log[0].action, CorrectionAction::SwapLatLon);
    EXPECT_EQ(r.log[1].siteID, "2");
    EXPECT_EQ(r.log[1].action, CorrectionAction::Mismatch);

    EXPECT_TRUE(r.audit.csv.ok) << r.audit.csv.message;
    EXPECT_EQ(r.audit.csv.path, dir.file("sites_fixed.csv"));
    const std::string fixed = read_file(dir.file("sites_fixed.csv"));
    EXPECT_NE(fixed.find("1,Swapped Mine,2,2,-30.56,22.94,1200,Copper,South Africa,"),
              std::string::npos);
    EXPECT_NE(fixed.find("5,Broken Mine,2,2,n/a,22.9,10,Copper,South Africa,\n"),
              std::string::npos);
    EXPECT_NE(read_file(dir.file("sites.csv")).find("1,Swapped Mine,2,2,22.94,-30.56"),
              std::string::npos);

    ASSERT_EQ(r.production.size(), 1u);
    EXPECT_EQ(r.production[0].mineralName.value_or(""), "Cobalt");

    ASSERT_EQ(r.summaries.size(), 5u);
    EXPECT_EQ(r.summaries[0].stageName, "join_sites");
    EXPECT_EQ(r.summaries[1].stageName, "cc_latlon");
    EXPECT_EQ(r.summaries[1].flaggedCount, 2u);
    EXPECT_EQ(r.summaries[2].stageName, "export_csv");
    EXPECT_FALSE(r.summaries[2].skipped);
    EXPECT_EQ(r.summaries[3].stageName, "export_geojson");
    EXPECT_TRUE(r.summaries[3].skipped);
    EXPECT_EQ(r.summaries[4].stageName, "join_production");
}

TEST(RunSitePipeline, RunsDoNotShareHistory) {
    ScratchDir dir;
    write_reference_tables(dir);
    write_sites(dir);
    PipelineConfig cfg = quiet_config(dir);
    std::ostringstream out, err;
    PipelineInputs in = load_pipeline_inputs(cfg, err);
    CoordinateValidator validator(default_centroids());

    PipelineResult first = run_site_pipeline(in, validator, cfg, out, err);
    PipelineResult second = run_site_pipeline(in, validator, cfg, out, err);
    EXPECT_EQ(first.log.size(), 2u);
    EXPECT_EQ(second.log.size(), 2u);
}

TEST(RunSitePipeline, CleanInputWritesNothing) {
    ScratchDir dir;
    write_reference_tables(dir);
    write_file(dir.file("sites.csv"),
               "SiteID,SiteName,MineralID,CountryID,Latitude,Longitude\n"
               "3,Fine Mine,1,1,-4.0,21.8\n");
    PipelineConfig cfg = quiet_config(dir);
    std::ostringstream out, err;
    PipelineInputs in = load_pipeline_inputs(cfg, err);
    CoordinateValidator validator(default_centroids());
    PipelineResult r = run_site_pipeline(in, validator, cfg, out, err);
    EXPECT_TRUE(r.log.empty());
    EXPECT_FALSE(r.audit.csv.attempted);
    EXPECT_TRUE(r.summaries[2].skipped);
    EXPECT_FALSE(fs::exists(dir.file("sites_fixed.csv")));
}

TEST(RunSitePipeline, GeoJsonTargetOnInputTableLeavesItIntact) {
    ScratchDir dir;
    write_reference_tables(dir);
    write_sites(dir);
    const std::string before = read_file(dir.file("sites.csv"));
    PipelineConfig cfg = quiet_config(dir);
    cfg.geojsonPath = dir.file("sites.csv");
    std::ostringstream out, err;
    PipelineInputs in = load_pipeline_inputs(cfg, err);
    CoordinateValidator validator(default_centroids());
    PipelineResult r = run_site_pipeline(in, validator, cfg, out, err);

    EXPECT_TRUE(r.geojson.attempted);
    EXPECT_FALSE(r.geojson.ok);
    EXPECT_NE(err.str().find("warning: failed to write GeoJSON"), std::string::npos);
    EXPECT_EQ(read_file(dir.file("sites.csv")), before);
    EXPECT_EQ(r.log.size(), 2u);
}

TEST(RunSitePipeline, EmptyInputsGiveEmptyResult) {
    PipelineInputs in;
    PipelineConfig cfg;
    cfg.verbose = false;
    std::ostringstream out, err;
    CoordinateValidator validator(default_centroids());
    PipelineResult r = run_site_pipeline(in, validator, cfg, out, err);
    EXPECT_TRUE(r.sites.empty());
    EXPECT_TRUE(r.log.empty());
    EXPECT_TRUE(r.production.empty());
    EXPECT_TRUE(out.str().empty());
}

TEST(PrintStageSummary, OneLinePerStage) {
    std::ostringstream out;
    print_stage_summary({{"join_sites", 3, 1, false, 0.5},
                         {"export_geojson", 3, 0, true, 0.0}},
                        out);
    const std::string s = out.str();
    EXPECT_NE(s.find("--- Pipeline Summary ---"), std::string::npos);
    EXPECT_NE(s.find("join_sites: 3 records, 1 flagged, took 0.5 seconds\n"), std::string::npos);
    EXPECT_NE(s.find("export_geojson: 3 records, 0 flagged, took 0 seconds (SKIPPED)\n"),
              std::string::npos);
}
