#pragma once
#include <vector>

#include "centroid_table.h"
#include "site_records.h"

enum class SiteClass { Consistent, SwapCorrectable, UnresolvedMismatch };

const char *class_name(SiteClass c);

struct Verdict {
    SiteClass cls = SiteClass::Consistent;
    bool      checked = false;   // false: malformed coordinates or no centroid
    GeoPoint  centroid = GeoPoint(0.0, 0.0);
};

// Coarse rectangular (Manhattan) distance in degrees; not geodesic.
double rectangular_distance(double lat, double lon, const GeoPoint &centroid);

/*
 * CoordinateValidator: compares a site against its country's centroid.
 * Inside +/-10 deg latitude and +/-20 deg longitude the site is consistent.
 * Further away, the site is swap-correctable when exchanging lat/lon strictly
 * reduces the rectangular distance, otherwise an unresolved mismatch.
 */
class CoordinateValidator {
public:
    static constexpr double kMaxLatDeviation = 10.0;
    static constexpr double kMaxLonDeviation = 20.0;

    explicit CoordinateValidator(CentroidTable centroids);

    Verdict classify(const SiteRecord &site) const;
    // One verdict per site, same order. Runs under OpenMP when available.
    std::vector<Verdict> classify_all(const std::vector<SiteRecord> &sites) const;

    const CentroidTable &centroids() const { return centroids_; }

private:
    CentroidTable centroids_;
};
