#include "geojson_export.h"

#include <filesystem>
#include <optional>
#include <system_error>

#include "gdal_priv.h"
#include "ogrsf_frmts.h"
#include "cpl_error.h"

static bool create_string_field(OGRLayer *layer, const char *name) {
    OGRFieldDefn field(name, OFTString);
    return layer->CreateField(&field) == OGRERR_NONE;
}

static void set_optional(OGRFeature *feat, const char *name,
                         const std::optional<std::string> &value) {
    if (value)
        feat->SetField(name, value->c_str());
    else
        feat->SetFieldNull(feat->GetFieldIndex(name));
}

ExportStatus export_sites_geojson(const std::vector<SiteRecord> &sites,
                                  const std::string &path,
                                  const std::string &inputPath) {
    ExportStatus status;
    status.attempted = true;
    status.path = path;
    if (!inputPath.empty() && same_file(path, inputPath)) {
        status.message = "refusing to overwrite input table " + inputPath;
        return status;
    }

    GDALAllRegister();
    GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("GeoJSON");
    if (!drv) {
        status.message = "GDAL GeoJSON driver not available";
        return status;
    }

    // the GeoJSON driver will not create over an existing file
    std::error_code ec;
    std::filesystem::remove(path, ec);

    GDALDataset *ds = drv->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!ds) {
        status.message = "cannot create " + path + ": " + CPLGetLastErrorMsg();
        return status;
    }

    OGRSpatialReference srs;
    srs.SetWellKnownGeogCS("WGS84");
    OGRLayer *layer = ds->CreateLayer("sites", &srs, wkbPoint, nullptr);
    if (!layer) {
        GDALClose(ds);
        status.message = "cannot create layer in " + path;
        return status;
    }

    const char *fields[] = {"SiteID", "SiteName", "MineralID", "CountryID",
                            "MineralName", "CountryName", "Production_tonnes", "Note"};
    for (const char *name : fields) {
        if (!create_string_field(layer, name)) {
            GDALClose(ds);
            status.message = std::string("cannot create field ") + name;
            return status;
        }
    }

    size_t written = 0;
    for (const auto &s : sites) {
        OGRFeature *feat = OGRFeature::CreateFeature(layer->GetLayerDefn());
        feat->SetField("SiteID", s.siteID.c_str());
        feat->SetField("SiteName", s.siteName.c_str());
        feat->SetField("MineralID", s.mineralID.c_str());
        feat->SetField("CountryID", s.countryID.c_str());
        set_optional(feat, "MineralName", s.mineralName);
        set_optional(feat, "CountryName", s.countryName);
        feat->SetField("Production_tonnes", s.production.c_str());
        feat->SetField("Note", s.note.c_str());
        if (s.has_valid_coordinates()) {
            OGRPoint pt(s.lon, s.lat);
            feat->SetGeometry(&pt);
        }
        const OGRErr err = layer->CreateFeature(feat);
        OGRFeature::DestroyFeature(feat);
        if (err != OGRERR_NONE) {
            GDALClose(ds);
            status.message = "failed to write feature for site " + s.siteID;
            return status;
        }
        ++written;
    }
    GDALClose(ds);

    status.ok = true;
    status.message = "Wrote " + std::to_string(written) + " site features to " + path;
    return status;
}
