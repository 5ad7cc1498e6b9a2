#pragma once
#include <cmath>
#include <limits>
#include <optional>
#include <string>

#include <boost/geometry.hpp>

namespace bg = boost::geometry;

// x = longitude, y = latitude (same axis order as OGRPoint).
typedef bg::model::point<double, 2, bg::cs::cartesian> GeoPoint;

inline GeoPoint make_geo_point(double lat, double lon) {
    return GeoPoint(lon, lat);
}
inline double lat_of(const GeoPoint &p) { return bg::get<1>(p); }
inline double lon_of(const GeoPoint &p) { return bg::get<0>(p); }

// --------------------
// Reference Tables
// --------------------
struct MineralRef {
    std::string mineralID;
    std::string name;
};

struct CountryRef {
    std::string countryID;
    std::string name;
};

// --------------------
// Site Rows
// --------------------

// One row of sites.csv as read from disk, nothing interpreted yet.
struct RawSiteRow {
    std::string siteID;
    std::string siteName;
    std::string mineralID;
    std::string countryID;
    std::string latitude;
    std::string longitude;
    std::string production;
};

struct SiteRecord {
    std::string siteID;
    std::string siteName;
    std::string mineralID;
    std::string countryID;
    std::optional<std::string> mineralName;
    std::optional<std::string> countryName;
    double      lat = std::numeric_limits<double>::quiet_NaN();
    double      lon = std::numeric_limits<double>::quiet_NaN();
    std::string latText;     // original cell, written back verbatim
    std::string lonText;
    std::string production;
    std::string note;        // empty when the record was left alone

    bool has_valid_coordinates() const {
        return std::isfinite(lat) && std::isfinite(lon);
    }
};

// --------------------
// Production Statistics
// --------------------
struct RawProductionRow {
    std::string mineralID;
    std::string countryID;
    std::string year;
    std::string productionTonnes;
    std::string exportValue;
};

struct ProductionRecord {
    std::string mineralID;
    std::string countryID;
    std::optional<std::string> mineralName;
    std::optional<std::string> countryName;
    std::string year;
    std::string productionTonnes;
    std::string exportValue;
};

// --------------------
// Audit Events
// --------------------
enum class CorrectionAction { SwapLatLon, Mismatch };

inline const char *action_name(CorrectionAction a) {
    return a == CorrectionAction::SwapLatLon ? "swap_latlon" : "mismatch";
}

struct CorrectionEvent {
    std::string             siteID;
    std::string             siteName;
    std::string             countryName;
    CorrectionAction        action = CorrectionAction::Mismatch;
    GeoPoint                oldPos = GeoPoint(0.0, 0.0);
    std::optional<GeoPoint> newPos;     // set for swap_latlon only
    GeoPoint                centroid = GeoPoint(0.0, 0.0);
};
