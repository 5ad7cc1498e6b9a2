#include "reference_join.h"

#include <iostream>

#include "csv_tables.h"

template<typename Ref, typename IdOf>
static NameIndex build_index(const std::vector<Ref> &refs, IdOf idOf,
                             const char *what, bool verbose) {
    NameIndex index;
    index.reserve(refs.size());
    size_t duplicates = 0;
    for (const auto &ref : refs) {
        std::string id = trim(idOf(ref));
        if (id.empty())
            continue;
        if (!index.emplace(id, ref.name).second)
            ++duplicates;
    }
    if (verbose && duplicates > 0) {
        std::cerr << "warning: " << duplicates << " duplicate " << what
                  << " identifiers ignored (first entry kept)." << std::endl;
    }
    return index;
}

NameIndex build_mineral_index(const std::vector<MineralRef> &minerals, bool verbose) {
    return build_index(minerals, [](const MineralRef &m) { return m.mineralID; },
                       "mineral", verbose);
}

NameIndex build_country_index(const std::vector<CountryRef> &countries, bool verbose) {
    return build_index(countries, [](const CountryRef &c) { return c.countryID; },
                       "country", verbose);
}

std::optional<std::string> lookup_name(const NameIndex &index, const std::string &id) {
    auto it = index.find(trim(id));
    if (it == index.end() || it->second.empty())
        return std::nullopt;
    return it->second;
}

SiteRecord make_site_record(const RawSiteRow &row,
                            const NameIndex &minerals,
                            const NameIndex &countries) {
    SiteRecord rec;
    rec.siteID      = row.siteID;
    rec.siteName    = row.siteName;
    rec.mineralID   = row.mineralID;
    rec.countryID   = row.countryID;
    rec.mineralName = lookup_name(minerals, row.mineralID);
    rec.countryName = lookup_name(countries, row.countryID);
    rec.latText     = row.latitude;
    rec.lonText     = row.longitude;
    rec.production  = row.production;

    double lat = 0.0, lon = 0.0;
    if (parse_coordinate(row.latitude, lat) && parse_coordinate(row.longitude, lon)) {
        rec.lat = lat;
        rec.lon = lon;
    }
    return rec;
}

std::vector<SiteRecord> join_sites(const std::vector<RawSiteRow> &rows,
                                   const std::vector<MineralRef> &minerals,
                                   const std::vector<CountryRef> &countries,
                                   bool verbose) {
    const NameIndex mineralIndex = build_mineral_index(minerals, verbose);
    const NameIndex countryIndex = build_country_index(countries, verbose);

    std::vector<SiteRecord> out;
    out.reserve(rows.size());
    size_t unknownMineral = 0, unknownCountry = 0, badCoords = 0;
    for (const auto &row : rows) {
        out.push_back(make_site_record(row, mineralIndex, countryIndex));
        const SiteRecord &rec = out.back();
        if (!rec.mineralName) ++unknownMineral;
        if (!rec.countryName) ++unknownCountry;
        if (!rec.has_valid_coordinates()) ++badCoords;
    }
    if (verbose) {
        std::cout << "join_sites: " << out.size() << " sites, "
                  << unknownMineral << " unknown mineral, "
                  << unknownCountry << " unknown country, "
                  << badCoords << " without numeric coordinates." << std::endl;
    }
    return out;
}

std::vector<ProductionRecord> join_production(const std::vector<RawProductionRow> &rows,
                                              const std::vector<MineralRef> &minerals,
                                              const std::vector<CountryRef> &countries,
                                              bool verbose) {
    const NameIndex mineralIndex = build_mineral_index(minerals, false);
    const NameIndex countryIndex = build_country_index(countries, false);

    std::vector<ProductionRecord> out;
    out.reserve(rows.size());
    for (const auto &row : rows) {
        ProductionRecord rec;
        rec.mineralID        = row.mineralID;
        rec.countryID        = row.countryID;
        rec.mineralName      = lookup_name(mineralIndex, row.mineralID);
        rec.countryName      = lookup_name(countryIndex, row.countryID);
        rec.year             = row.year;
        rec.productionTonnes = row.productionTonnes;
        rec.exportValue      = row.exportValue;
        out.push_back(std::move(rec));
    }
    if (verbose)
        std::cout << "join_production: " << out.size() << " production rows." << std::endl;
    return out;
}
