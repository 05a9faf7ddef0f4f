#include <stdio.h>
#include <math.h>
#include <cmath>
#include <string>
#include <stdexcept>
#include "projection.hpp"
#include "distance.hpp"

const resolution_table resolutions;

// circumference = 2 * pi * r = pi * diameter
// http://wiki.openstreetmap.org/wiki/Zoom_levels
resolution_table::resolution_table() {
	max_resolution = M_PI * earth_diameter(0.0) * 1000 / TILE_PIXELS;

	for (int z = 0; z < ZOOMS; z++) {
		resolutions[z] = max_resolution / std::pow(2, z);
	}
}

double resolution_table::resolution(int zoom) const {
	if (zoom < 0 || zoom > MAX_ZOOM) {
		throw std::out_of_range("zoom level " + std::to_string(zoom) + " is outside 0.." + std::to_string(MAX_ZOOM));
	}

	return resolutions[zoom];
}

// Convert from Spherical Mercator meters to degrees (EPSG:4326).
// See also https://github.com/mapbox/clustr/blob/gh-pages/src/clustr.js
void epsg3857tolonlat(double x, double y, double *lon, double *lat) {
	*lon = x * (180 / M_PI) / EARTH_RADIUS_M;
	*lat = (M_PI / 2 - 2 * atan(exp(-y / EARTH_RADIUS_M))) * (180 / M_PI);
}
