#include "centroid_table.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "gdal_priv.h"
#include "ogrsf_frmts.h"

#include "csv_tables.h"

void CentroidTable::set(const std::string &country, double lat, double lon) {
    centroids_[country] = make_geo_point(lat, lon);
}

const GeoPoint *CentroidTable::find(const std::string &country) const {
    auto it = centroids_.find(country);
    return it == centroids_.end() ? nullptr : &it->second;
}

std::vector<std::string> CentroidTable::countries() const {
    std::vector<std::string> names;
    names.reserve(centroids_.size());
    for (const auto &kv : centroids_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

CentroidTable default_centroids() {
    CentroidTable table;
    table.set("DRC (Congo)", -4.038333, 21.758664);
    table.set("South Africa", -30.559482, 22.937506);
    table.set("Mozambique", -18.665695, 35.529562);
    table.set("Namibia", -22.9576, 18.4904);
    return table;
}

// function to load country centroids from a csv file
CentroidTable loadCentroidsCSV(const std::string &filename, bool verbose) {
    CsvTable csv = readCSVTable(filename);
    const int nameIndex = csv.require({"name", "countryname", "country"});
    int latIndex = csv.column({"centroid.lat", "latitude", "lat"});
    int lonIndex = csv.column({"centroid.lon", "longitude", "lon"});
    if (latIndex < 0 || lonIndex < 0) {
        throw std::runtime_error("header of " + filename +
                                 " does not contain centroid.lat/centroid.lon columns");
    }

    CentroidTable table;
    size_t skipped = 0;
    for (const auto &tokens : csv.rows) {
        double lat = 0.0, lon = 0.0;
        const std::string &name = tokens[nameIndex];
        if (name.empty() ||
            !parse_coordinate(tokens[latIndex], lat) ||
            !parse_coordinate(tokens[lonIndex], lon)) {
            ++skipped;
            continue;
        }
        table.set(name, lat, lon);
    }
    if (verbose) {
        std::cout << "loaded " << table.size() << " centroids from " << filename;
        if (skipped > 0)
            std::cout << " (" << skipped << " rows without name or coordinates skipped)";
        std::cout << std::endl;
    }
    return table;
}

CentroidTable loadCentroidsShapefile(const std::string &shpPath,
                                     const std::string &nameField,
                                     bool verbose) {
    GDALAllRegister();

    GDALDataset *ds = static_cast<GDALDataset*>(
        GDALOpenEx(shpPath.c_str(), GDAL_OF_VECTOR, nullptr, nullptr, nullptr));
    if (!ds) throw std::runtime_error("Unable to open country shapefile: " + shpPath);

    OGRLayer *layer = ds->GetLayer(0);
    if (!layer) {
        GDALClose(ds);
        throw std::runtime_error("No layer in shapefile: " + shpPath);
    }
    if (layer->GetLayerDefn()->GetFieldIndex(nameField.c_str()) < 0) {
        GDALClose(ds);
        throw std::runtime_error("Field " + nameField + " not found in " + shpPath);
    }

    CentroidTable table;
    size_t noGeometry = 0;
    layer->ResetReading();
    OGRFeature *feat;
    while ((feat = layer->GetNextFeature())) {
        OGRGeometry *geom = feat->GetGeometryRef();
        const char *name = feat->GetFieldAsString(nameField.c_str());
        OGRPoint centroid;
        if (geom && name && *name && geom->Centroid(&centroid) == OGRERR_NONE) {
            // OGR points are (x = lon, y = lat)
            table.set(trim(name), centroid.getY(), centroid.getX());
        } else {
            ++noGeometry;
        }
        OGRFeature::DestroyFeature(feat);
    }
    GDALClose(ds);

    if (verbose) {
        std::cout << "loaded " << table.size() << " country centroids from " << shpPath;
        if (noGeometry > 0)
            std::cout << " (" << noGeometry << " features without name or geometry)";
        std::cout << std::endl;
    }
    return table;
}
