#pragma once
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "cc_latlon.h"
#include "correction_log.h"
#include "site_records.h"

// Outcome of writing a durable copy. A failed export never invalidates the
// in-memory result it was written from.
struct ExportStatus {
    bool        attempted = false;
    bool        ok = false;
    std::string path;
    std::string message;
};

// "(lat, lon)"
std::string format_latlon(const GeoPoint &p);

// One operator-facing line per event:
//  - Site 7 (Kolwezi) in DRC (Congo): swapped (21.76, -4.04) -> (-4.04, 21.76)
//  - Site 9 (Rosh Pinah) in Namibia: mismatch (5, 5) (country centroid (-22.9576, 18.4904))
std::string format_event(const CorrectionEvent &event);
std::vector<std::string> format_log(const CorrectionLog &log);

// Writes the header line followed by format_log(), nothing for an empty log.
void emit_log(const CorrectionLog &log, std::ostream &out);

// data/sites.csv -> data/sites_fixed.csv
std::string corrected_path_for(const std::string &inputPath);

// True when both paths name the same file (lexically or on disk).
bool same_file(const std::string &a, const std::string &b);

// Writes `sites` to `outputPath`; refuses to overwrite `inputPath`.
ExportStatus export_sites_csv(const std::vector<SiteRecord> &sites,
                              const std::string &outputPath,
                              const std::string &inputPath);

struct SinkOptions {
    std::string inputPath;        // raw site table, never written
    std::string outputPath;       // empty: corrected_path_for(inputPath)
    bool        verbose = true;
};

struct AuditReport {
    std::vector<std::string> lines;
    ExportStatus             csv;
};

/*
 * publish_corrections: Emits the correction log and persists the corrected
 * sites when the pass produced at least one event. Persistence failures are
 * reported on `err` as warnings and returned in the report.
 */
AuditReport publish_corrections(const CorrectionPass &pass,
                                const SinkOptions &options,
                                std::ostream &out = std::cout,
                                std::ostream &err = std::cerr);
