#ifndef GEOHASH_HPP
#define GEOHASH_HPP

#include <string>

#define GEOHASH_MAX_PRECISION 24

enum geohash_direction {
	geohash_top,
	geohash_bottom,
	geohash_left,
	geohash_right,
};

std::string geohash_encode(double lon, double lat, size_t len);
bool geohash_bbox(std::string const &hash, double *minlon, double *minlat, double *maxlon, double *maxlat);

double geohash_cell_width(size_t len);
double geohash_cell_height(size_t len);
int geohash_length_for_bbox(double width, double height);

std::string geohash_neighbor(std::string const &hash, geohash_direction dir);

#endif
