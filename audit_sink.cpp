#include "audit_sink.h"

#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "csv_tables.h"

namespace fs = std::filesystem;

std::string format_latlon(const GeoPoint &p) {
    std::ostringstream oss;
    oss << std::setprecision(10) << "(" << lat_of(p) << ", " << lon_of(p) << ")";
    return oss.str();
}

std::string format_event(const CorrectionEvent &event) {
    std::ostringstream oss;
    oss << " - Site " << event.siteID << " (" << event.siteName << ") in "
        << event.countryName << ": ";
    if (event.action == CorrectionAction::SwapLatLon && event.newPos) {
        oss << "swapped " << format_latlon(event.oldPos)
            << " -> " << format_latlon(*event.newPos);
    } else {
        oss << "mismatch " << format_latlon(event.oldPos)
            << " (country centroid " << format_latlon(event.centroid) << ")";
    }
    return oss.str();
}

std::vector<std::string> format_log(const CorrectionLog &log) {
    std::vector<std::string> lines;
    lines.reserve(log.size());
    for (const auto &ev : log)
        lines.push_back(format_event(ev));
    return lines;
}

void emit_log(const CorrectionLog &log, std::ostream &out) {
    if (log.empty())
        return;
    out << "Site coordinate corrections applied:\n";
    for (const auto &line : format_log(log))
        out << line << "\n";
    out.flush();
}

std::string corrected_path_for(const std::string &inputPath) {
    fs::path p(inputPath);
    std::string stem = p.stem().string();
    if (stem.empty())
        stem = "sites";
    std::string ext = p.extension().string();
    if (ext.empty())
        ext = ".csv";
    return (p.parent_path() / (stem + "_fixed" + ext)).string();
}

bool same_file(const std::string &a, const std::string &b) {
    std::error_code ec;
    fs::path pa = fs::absolute(a, ec).lexically_normal();
    if (ec) pa = fs::path(a).lexically_normal();
    fs::path pb = fs::absolute(b, ec).lexically_normal();
    if (ec) pb = fs::path(b).lexically_normal();
    if (pa == pb)
        return true;
    // hard links / symlinks to the source
    bool eq = fs::equivalent(a, b, ec);
    return !ec && eq;
}

ExportStatus export_sites_csv(const std::vector<SiteRecord> &sites,
                              const std::string &outputPath,
                              const std::string &inputPath) {
    ExportStatus status;
    status.attempted = true;
    status.path = outputPath;
    if (!inputPath.empty() && same_file(outputPath, inputPath)) {
        status.message = "refusing to overwrite input table " + inputPath;
        return status;
    }
    try {
        writeSitesCSV(sites, outputPath);
        status.ok = true;
        status.message = "Wrote corrected sites to " + outputPath;
    } catch (const std::exception &e) {
        status.message = e.what();
    }
    return status;
}

AuditReport publish_corrections(const CorrectionPass &pass,
                                const SinkOptions &options,
                                std::ostream &out,
                                std::ostream &err) {
    AuditReport report;
    if (pass.log.empty())
        return report;

    report.lines = format_log(pass.log);
    if (options.verbose)
        emit_log(pass.log, out);

    const std::string outputPath = options.outputPath.empty()
                                       ? corrected_path_for(options.inputPath)
                                       : options.outputPath;
    report.csv = export_sites_csv(pass.sites, outputPath, options.inputPath);
    if (report.csv.ok) {
        if (options.verbose)
            out << report.csv.message << std::endl;
    } else {
        err << "warning: failed to write corrected sites CSV: "
            << report.csv.message << std::endl;
    }
    return report;
}
