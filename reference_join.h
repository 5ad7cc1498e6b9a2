#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "site_records.h"

// identifier -> display name
typedef std::unordered_map<std::string, std::string> NameIndex;

// First entry wins on duplicate identifiers (reported on stderr when verbose).
NameIndex build_mineral_index(const std::vector<MineralRef> &minerals, bool verbose = true);
NameIndex build_country_index(const std::vector<CountryRef> &countries, bool verbose = true);

std::optional<std::string> lookup_name(const NameIndex &index, const std::string &id);

/*
 * join_sites: Left-joins site rows to the mineral and country tables.
 * Output has the same length and order as `rows`; an identifier missing from
 * a table leaves the corresponding name empty (std::nullopt).
 */
std::vector<SiteRecord> join_sites(const std::vector<RawSiteRow> &rows,
                                   const std::vector<MineralRef> &minerals,
                                   const std::vector<CountryRef> &countries,
                                   bool verbose = true);

SiteRecord make_site_record(const RawSiteRow &row,
                            const NameIndex &minerals,
                            const NameIndex &countries);

std::vector<ProductionRecord> join_production(const std::vector<RawProductionRow> &rows,
                                              const std::vector<MineralRef> &minerals,
                                              const std::vector<CountryRef> &countries,
                                              bool verbose = true);
