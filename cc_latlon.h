#pragma once
#include <vector>

#include "coordinate_validator.h"
#include "correction_log.h"
#include "site_records.h"

extern const char *const kSwapNote;
extern const char *const kMismatchNote;

/*
 * apply_correction: Builds the corrected copy of `site` for its verdict.
 * SwapCorrectable exchanges latitude and longitude, UnresolvedMismatch only
 * annotates; both append one event to `log`. Consistent returns the site as is.
 * Only the coordinates and the note are ever changed.
 */
SiteRecord apply_correction(const SiteRecord &site, const Verdict &verdict,
                            CorrectionLog &log);

struct CorrectionPass {
    std::vector<SiteRecord> sites;     // same length and order as the input
    std::vector<SiteClass>  classes;
    CorrectionLog           log;

    size_t swapped() const { return log.count(CorrectionAction::SwapLatLon); }
    size_t flagged() const { return log.count(CorrectionAction::Mismatch); }
};

/*
 * cc_latlon: Validates every site and applies lat/lon swap corrections.
 * Running it again over its own output swaps nothing back. A swap that got
 * closer to the centroid but still lies outside the window is reported again
 * on the next pass, as a mismatch event.
 */
CorrectionPass cc_latlon(const std::vector<SiteRecord> &sites,
                         const CoordinateValidator &validator,
                         bool verbose = true);
