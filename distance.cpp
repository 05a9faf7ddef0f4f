#include <math.h>
#include <cmath>
#include <algorithm>
#include "distance.hpp"

// WGS84 semi-major and semi-minor axes, in meters
#define WGS84_A 6378137.0
#define WGS84_B 6356752.31420

/**
 * Diameter of the WGS84 ellipsoid at the given latitude (in degrees),
 * in kilometers. At the equator this is twice the semi-major axis.
 */
double earth_diameter(double lat) {
	double rad = lat * M_PI / 180;
	double cos2 = cos(rad) * cos(rad);
	double sin2 = sin(rad) * sin(rad);

	double a2 = WGS84_A * WGS84_A;
	double b2 = WGS84_B * WGS84_B;

	double radius = sqrt((a2 * a2 * cos2 + b2 * b2 * sin2) / (a2 * cos2 + b2 * sin2));
	return 2 * radius / 1000;
}

// Great-circle distance in meters, using the earth's diameter
// at the average latitude of the two points
double haversine(double lat1, double lon1, double lat2, double lon2) {
	double x1 = lat1 * M_PI / 180;
	double x2 = lat2 * M_PI / 180;

	double h1 = 1 - cos(x1 - x2);
	double h2 = 1 - cos((lon1 - lon2) * M_PI / 180);
	double h = h1 + cos(x1) * cos(x2) * h2;

	double diameter = earth_diameter((lat1 + lat2) / 2) * 1000;
	return diameter * asin(std::min(1.0, sqrt(h * 0.5)));
}

/**
 * Dumb correction for the variation of pixel size with latitude
 * on the Mercator projection. It is not a real geodesic solution.
 *
 * It is based on the observation that at latitude 0 the computed
 * distance is correct, while at latitude 48 it comes out as 223 pixels
 * where the real on-screen distance is 335.
 */
double pixel_correction(double lat) {
	return 1 + (335.0 / 223.271875276 - 1) * (std::fabs(lat) / 47.9899);
}

/**
 * Distance between two points in pixels at the given resolution
 * (meters per pixel). Only the first point's latitude is used for
 * the correction, so this is not symmetric.
 */
double distance_pixels(lonlat const &a, lonlat const &b, double resolution) {
	double distance = haversine(a.lat, a.lon, b.lat, b.lon);
	return distance / resolution * pixel_correction(a.lat);
}

bool should_cluster(lonlat const &a, lonlat const &b, double resolution, double distance_threshold) {
	return distance_pixels(a, b, resolution) <= distance_threshold;
}
