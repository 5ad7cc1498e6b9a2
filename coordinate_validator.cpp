#include "coordinate_validator.h"

#include <cmath>
#include <utility>

const char *class_name(SiteClass c) {
    switch (c) {
        case SiteClass::Consistent:         return "consistent";
        case SiteClass::SwapCorrectable:    return "swap_correctable";
        case SiteClass::UnresolvedMismatch: return "unresolved_mismatch";
    }
    return "consistent";
}

double rectangular_distance(double lat, double lon, const GeoPoint &centroid) {
    return std::abs(lat - lat_of(centroid)) + std::abs(lon - lon_of(centroid));
}

CoordinateValidator::CoordinateValidator(CentroidTable centroids)
    : centroids_(std::move(centroids)) {}

Verdict CoordinateValidator::classify(const SiteRecord &site) const {
    Verdict v;
    if (!site.has_valid_coordinates() || !site.countryName)
        return v;
    const GeoPoint *c = centroids_.find(*site.countryName);
    if (!c)
        return v;

    v.checked = true;
    v.centroid = *c;

    const double dLat = std::abs(site.lat - lat_of(*c));
    const double dLon = std::abs(site.lon - lon_of(*c));
    if (dLat <= kMaxLatDeviation && dLon <= kMaxLonDeviation)
        return v;

    // ties keep the stored order
    const double distOrig    = rectangular_distance(site.lat, site.lon, *c);
    const double distSwapped = rectangular_distance(site.lon, site.lat, *c);
    v.cls = (distSwapped < distOrig) ? SiteClass::SwapCorrectable
                                     : SiteClass::UnresolvedMismatch;
    return v;
}

std::vector<Verdict> CoordinateValidator::classify_all(const std::vector<SiteRecord> &sites) const {
    std::vector<Verdict> verdicts(sites.size());
#ifdef _OPENMP
    #pragma omp parallel for schedule(static)
    for (int i = 0; i < (int)sites.size(); ++i) {
        verdicts[i] = classify(sites[i]);
    }
#else
    for (size_t i = 0; i < sites.size(); ++i) verdicts[i] = classify(sites[i]);
#endif
    return verdicts;
}
