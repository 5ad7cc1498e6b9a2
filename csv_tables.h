#pragma once
#include <initializer_list>
#include <string>
#include <vector>

#include "site_records.h"

// --------------------
// Helper Functions
// --------------------
// Whitespace only; quoting is undone by split_line.
std::string trim(const std::string &s);
std::string lower(const std::string &s);

// Splits one CSV line. Double-quoted fields may contain the delimiter and
// "" escapes; the surrounding quotes are removed.
std::vector<std::string> split_line(const std::string &line, char delim);

// Strict numeric parse: the whole (trimmed) cell must be a finite number.
bool parse_coordinate(const std::string &text, double &out);

// --------------------
// Generic Table
// --------------------
struct CsvTable {
    std::string                           filename;
    std::vector<std::string>              header;   // trimmed, lower case
    std::vector<std::vector<std::string>> rows;     // padded to header width

    // Index of the first header matching one of the names, or -1.
    int column(std::initializer_list<const char *> names) const;
    // Same as column() but throws std::runtime_error when absent.
    int require(std::initializer_list<const char *> names) const;
};

// Throws std::runtime_error if the file cannot be opened or has no header.
CsvTable readCSVTable(const std::string &filename);

// --------------------
// Table Loaders
// --------------------
std::vector<RawSiteRow>       loadSitesCSV(const std::string &filename, bool verbose = true);
std::vector<MineralRef>       loadMineralsCSV(const std::string &filename, bool verbose = true);
std::vector<CountryRef>       loadCountriesCSV(const std::string &filename, bool verbose = true);
std::vector<RawProductionRow> loadProductionCSV(const std::string &filename, bool verbose = true);

// --------------------
// Writers
// --------------------
std::string csv_escape(const std::string &field, char delim = ',');

// Writes the corrected site table. Throws std::runtime_error on I/O failure.
void writeSitesCSV(const std::vector<SiteRecord> &sites, const std::string &filename);
