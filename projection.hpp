#ifndef PROJECTION_HPP
#define PROJECTION_HPP

#define MAX_ZOOM 30
#define ZOOMS (MAX_ZOOM + 1)
#define TILE_PIXELS 256

// Spherical Mercator (EPSG:3857) earth radius in meters
#define EARTH_RADIUS_M 6378137.0

// Meters per pixel at each zoom level. Zoom 0 shows the whole
// circumference of the earth across a single 256-pixel tile, and
// each zoom level after that halves the resolution.
struct resolution_table {
	double max_resolution;
	double resolutions[ZOOMS];

	resolution_table();

	// throws std::out_of_range for zooms outside [0, MAX_ZOOM]
	double resolution(int zoom) const;
};

extern const resolution_table resolutions;

void epsg3857tolonlat(double x, double y, double *lon, double *lat);

#endif
