#include "csv_tables.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

// --------------------
// Helper Functions
// --------------------
std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    size_t end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos || end == std::string::npos)
        return "";
    return s.substr(start, end - start + 1);
}

std::string lower(const std::string &s) {
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return l;
}

std::vector<std::string> split_line(const std::string &line, char delim) {
    std::vector<std::string> tokens;
    std::string cur;
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == delim) {
            tokens.push_back(cur);
            cur.clear();
        } else if (c != '\r' && c != '\n') {
            cur.push_back(c);
        }
    }
    tokens.push_back(cur);
    return tokens;
}

bool parse_coordinate(const std::string &text, double &out) {
    const std::string t = trim(text);
    if (t.empty())
        return false;
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(t, &pos);
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
    if (pos != t.size() || !std::isfinite(v))
        return false;
    out = v;
    return true;
}

// --------------------
// Generic Table
// --------------------
int CsvTable::column(std::initializer_list<const char *> names) const {
    for (const char *name : names) {
        for (size_t i = 0; i < header.size(); i++) {
            if (header[i] == name)
                return static_cast<int>(i);
        }
    }
    return -1;
}

int CsvTable::require(std::initializer_list<const char *> names) const {
    int idx = column(names);
    if (idx < 0)
        throw std::runtime_error("column '" + std::string(*names.begin()) +
                                 "' missing in " + filename);
    return idx;
}

CsvTable readCSVTable(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("cannot open csv file " + filename);

    CsvTable table;
    table.filename = filename;

    std::string headerLine;
    if (!std::getline(file, headerLine))
        throw std::runtime_error("csv file " + filename + " is empty");
    // UTF-8 BOM written by spreadsheet exports
    if (headerLine.compare(0, 3, "\xEF\xBB\xBF") == 0)
        headerLine.erase(0, 3);

    char delim = (headerLine.find('\t') != std::string::npos) ? '\t' : ',';
    for (const auto &t : split_line(headerLine, delim))
        table.header.push_back(lower(trim(t)));

    std::string line;
    while (std::getline(file, line)) {
        if (trim(line).empty())
            continue;
        std::vector<std::string> tokens = split_line(line, delim);
        tokens.resize(std::max(tokens.size(), table.header.size()));
        for (auto &t : tokens)
            t = trim(t);
        table.rows.push_back(std::move(tokens));
    }
    return table;
}

// --------------------
// Table Loaders
// --------------------
std::vector<RawSiteRow> loadSitesCSV(const std::string &filename, bool verbose) {
    CsvTable table = readCSVTable(filename);
    const int iID   = table.require({"siteid"});
    const int iName = table.require({"sitename"});
    const int iMin  = table.require({"mineralid"});
    const int iCoun = table.require({"countryid"});
    const int iLat  = table.require({"latitude", "lat"});
    const int iLon  = table.require({"longitude", "lon"});
    const int iProd = table.column({"production_tonnes", "production"});

    std::vector<RawSiteRow> rows;
    rows.reserve(table.rows.size());
    for (const auto &t : table.rows) {
        RawSiteRow r;
        r.siteID     = t[iID];
        r.siteName   = t[iName];
        r.mineralID  = t[iMin];
        r.countryID  = t[iCoun];
        r.latitude   = t[iLat];
        r.longitude  = t[iLon];
        if (iProd >= 0)
            r.production = t[iProd];
        rows.push_back(std::move(r));
    }
    if (verbose)
        std::cout << "loaded " << rows.size() << " sites from " << filename << std::endl;
    return rows;
}

std::vector<MineralRef> loadMineralsCSV(const std::string &filename, bool verbose) {
    CsvTable table = readCSVTable(filename);
    const int iID   = table.require({"mineralid"});
    const int iName = table.require({"mineralname", "name"});

    std::vector<MineralRef> minerals;
    minerals.reserve(table.rows.size());
    for (const auto &t : table.rows)
        minerals.push_back({t[iID], t[iName]});
    if (verbose)
        std::cout << "loaded " << minerals.size() << " minerals from " << filename << std::endl;
    return minerals;
}

std::vector<CountryRef> loadCountriesCSV(const std::string &filename, bool verbose) {
    CsvTable table = readCSVTable(filename);
    const int iID   = table.require({"countryid"});
    const int iName = table.require({"countryname", "name"});

    std::vector<CountryRef> countries;
    countries.reserve(table.rows.size());
    for (const auto &t : table.rows)
        countries.push_back({t[iID], t[iName]});
    if (verbose)
        std::cout << "loaded " << countries.size() << " countries from " << filename << std::endl;
    return countries;
}

std::vector<RawProductionRow> loadProductionCSV(const std::string &filename, bool verbose) {
    CsvTable table = readCSVTable(filename);
    const int iMin  = table.require({"mineralid"});
    const int iCoun = table.require({"countryid"});
    const int iYear = table.column({"year"});
    const int iProd = table.column({"production_tonnes", "production"});
    const int iExp  = table.column({"exportvalue_billionusd", "exportvalue"});

    std::vector<RawProductionRow> rows;
    rows.reserve(table.rows.size());
    for (const auto &t : table.rows) {
        RawProductionRow r;
        r.mineralID = t[iMin];
        r.countryID = t[iCoun];
        if (iYear >= 0) r.year = t[iYear];
        if (iProd >= 0) r.productionTonnes = t[iProd];
        if (iExp >= 0)  r.exportValue = t[iExp];
        rows.push_back(std::move(r));
    }
    if (verbose)
        std::cout << "loaded " << rows.size() << " production rows from " << filename << std::endl;
    return rows;
}

// --------------------
// Writers
// --------------------
std::string csv_escape(const std::string &field, char delim) {
    if (field.find_first_of(std::string("\"\r\n") + delim) == std::string::npos)
        return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"')
            out += "\"\"";
        else
            out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void writeSitesCSV(const std::vector<SiteRecord> &sites, const std::string &filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open())
        throw std::runtime_error("cannot open output file " + filename + " for writing");

    outfile << "SiteID,SiteName,MineralID,CountryID,Latitude,Longitude,"
               "Production_tonnes,MineralName,CountryName,Note\n";
    for (const auto &s : sites) {
        outfile << csv_escape(s.siteID) << ','
                << csv_escape(s.siteName) << ','
                << csv_escape(s.mineralID) << ','
                << csv_escape(s.countryID) << ','
                << csv_escape(s.latText) << ','
                << csv_escape(s.lonText) << ','
                << csv_escape(s.production) << ','
                << csv_escape(s.mineralName.value_or("")) << ','
                << csv_escape(s.countryName.value_or("")) << ','
                << csv_escape(s.note) << '\n';
    }
    outfile.flush();
    if (!outfile)
        throw std::runtime_error("write to " + filename + " failed");
}
