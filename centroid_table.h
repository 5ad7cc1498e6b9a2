#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "site_records.h"

// Country name -> approximate reference coordinate. Countries absent from the
// table are never validated.
class CentroidTable {
public:
    void set(const std::string &country, double lat, double lon);
    // nullptr when the country has no known centroid.
    const GeoPoint *find(const std::string &country) const;

    size_t size() const { return centroids_.size(); }
    bool empty() const { return centroids_.empty(); }
    std::vector<std::string> countries() const;

private:
    std::unordered_map<std::string, GeoPoint> centroids_;
};

// The four southern-African reference centroids the site tables were built around.
CentroidTable default_centroids();

// Loads a country reference csv. Name column: name / countryname / country;
// coordinates: centroid.lat + centroid.lon, or latitude + longitude.
// Throws std::runtime_error if the file or a required column is missing.
CentroidTable loadCentroidsCSV(const std::string &filename, bool verbose = true);

// Derives centroids from a country polygon layer (e.g. Natural Earth admin 0),
// one entry per feature, keyed by the `nameField` attribute.
// Throws std::runtime_error if the dataset or field cannot be opened.
CentroidTable loadCentroidsShapefile(const std::string &shpPath,
                                     const std::string &nameField = "NAME",
                                     bool verbose = true);
