#pragma once
#include <string>
#include <vector>

#include "audit_sink.h"
#include "site_records.h"

/*
 * export_sites_geojson: Writes the corrected sites as WGS84 point features
 * through the GDAL GeoJSON driver. Sites without numeric coordinates are kept
 * as features with no geometry. An existing file at `path` is replaced,
 * unless it is `inputPath`, which is never touched.
 */
ExportStatus export_sites_geojson(const std::vector<SiteRecord> &sites,
                                  const std::string &path,
                                  const std::string &inputPath = "");
