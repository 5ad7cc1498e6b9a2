#include "cc_latlon.h"

#include <iostream>
#include <utility>

const char *const kSwapNote =
    "Swapped lat/lon due to large mismatch with country centroid.";
const char *const kMismatchNote =
    "Coordinate far from assigned country centroid; left unchanged for manual review.";

SiteRecord apply_correction(const SiteRecord &site, const Verdict &verdict,
                            CorrectionLog &log) {
    SiteRecord out = site;
    if (verdict.cls == SiteClass::Consistent)
        return out;

    CorrectionEvent ev;
    ev.siteID      = site.siteID;
    ev.siteName    = site.siteName;
    ev.countryName = site.countryName.value_or("");
    ev.oldPos      = make_geo_point(site.lat, site.lon);
    ev.centroid    = verdict.centroid;

    if (verdict.cls == SiteClass::SwapCorrectable) {
        out.lat = site.lon;
        out.lon = site.lat;
        std::swap(out.latText, out.lonText);
        out.note = kSwapNote;
        ev.action = CorrectionAction::SwapLatLon;
        ev.newPos = make_geo_point(out.lat, out.lon);
    } else {
        out.note = kMismatchNote;
        ev.action = CorrectionAction::Mismatch;
    }
    log.append(std::move(ev));
    return out;
}

CorrectionPass cc_latlon(const std::vector<SiteRecord> &sites,
                         const CoordinateValidator &validator,
                         bool verbose) {
    // classification is per record and may run in parallel; corrections and
    // log appends stay sequential so the log keeps input order
    const std::vector<Verdict> verdicts = validator.classify_all(sites);

    CorrectionPass pass;
    pass.sites.reserve(sites.size());
    pass.classes.reserve(sites.size());
    size_t checked = 0;
    for (size_t i = 0; i < sites.size(); i++) {
        if (verdicts[i].checked)
            ++checked;
        pass.classes.push_back(verdicts[i].cls);
        pass.sites.push_back(apply_correction(sites[i], verdicts[i], pass.log));
    }
    if (verbose) {
        std::cout << "cc_latlon: checked " << checked << " of " << sites.size()
                  << " sites, swapped " << pass.swapped()
                  << ", flagged " << pass.flagged() << " for review." << std::endl;
    }
    return pass;
}
