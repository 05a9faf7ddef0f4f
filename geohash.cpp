#include <string.h>
#include <math.h>
#include <cmath>
#include <string>
#include "geohash.hpp"

static const char base32[] = "0123456789bcdefghjkmnpqrstuvwxyz";

// http://github.com/davetroy/geohash-js
//
// Indexed by direction and then by whether the hash length is even (0) or odd (1).
// The neighbor of a cell in a given direction is the base32 character at the
// position where the cell's last character appears in the neighbors string.
// If the last character is on the border in that direction, the parent cell
// has to move too.

static const char *neighbors[4][2] = {
	{"p0r21436x8zb9dcf5h7kjnmqesgutwvy", "bc01fg45238967deuvhjyznpkmstqrwx"},  // top
	{"14365h7k9dcfesgujnmqp0r2twvyx8zb", "238967debc01fg45kmstqrwxuvhjyznp"},  // bottom
	{"238967debc01fg45kmstqrwxuvhjyznp", "14365h7k9dcfesgujnmqp0r2twvyx8zb"},  // left
	{"bc01fg45238967deuvhjyznpkmstqrwx", "p0r21436x8zb9dcf5h7kjnmqesgutwvy"},  // right
};

static const char *borders[4][2] = {
	{"prxz", "bcfguvyz"},  // top
	{"028b", "0145hjnp"},  // bottom
	{"0145hjnp", "028b"},  // left
	{"bcfguvyz", "prxz"},  // right
};

static int base32_index(char c) {
	const char *found = strchr(base32, c);
	if (c == '\0' || found == NULL) {
		return -1;
	}
	return found - base32;
}

std::string geohash_encode(double lon, double lat, size_t len) {
	double minlon = -180, maxlon = 180;
	double minlat = -90, maxlat = 90;
	bool is_lon = true;

	std::string out;
	int ch = 0;
	int bit = 0;

	while (out.size() < len) {
		ch <<= 1;

		if (is_lon) {
			double mid = (minlon + maxlon) / 2;
			if (lon > mid) {
				ch |= 1;
				minlon = mid;
			} else {
				maxlon = mid;
			}
		} else {
			double mid = (minlat + maxlat) / 2;
			if (lat > mid) {
				ch |= 1;
				minlat = mid;
			} else {
				maxlat = mid;
			}
		}

		is_lon = !is_lon;

		if (++bit == 5) {
			out.push_back(base32[ch]);
			bit = 0;
			ch = 0;
		}
	}

	return out;
}

// Returns false if the hash contains characters that are not geohash base32
bool geohash_bbox(std::string const &hash, double *minlon, double *minlat, double *maxlon, double *maxlat) {
	*minlon = -180;
	*maxlon = 180;
	*minlat = -90;
	*maxlat = 90;
	bool is_lon = true;

	for (char c : hash) {
		int v = base32_index(c);
		if (v < 0) {
			return false;
		}

		for (int i = 4; i >= 0; i--) {
			int b = (v >> i) & 1;

			if (is_lon) {
				double mid = (*minlon + *maxlon) / 2;
				if (b) {
					*minlon = mid;
				} else {
					*maxlon = mid;
				}
			} else {
				double mid = (*minlat + *maxlat) / 2;
				if (b) {
					*minlat = mid;
				} else {
					*maxlat = mid;
				}
			}

			is_lon = !is_lon;
		}
	}

	return true;
}

// Each character carries 5 bits, alternating longitude and latitude
// and starting with longitude, so longitude gets the odd bit.

double geohash_cell_width(size_t len) {
	size_t lon_bits = (5 * len + 1) / 2;
	return 360.0 / std::pow(2, lon_bits);
}

double geohash_cell_height(size_t len) {
	size_t lat_bits = 5 * len / 2;
	return 180.0 / std::pow(2, lat_bits);
}

/**
 * The shortest geohash length whose cells are both narrower than `width`
 * and shorter than `height` (in degrees), or GEOHASH_MAX_PRECISION if
 * no length is that small.
 */
int geohash_length_for_bbox(double width, double height) {
	for (int len = 1; len < GEOHASH_MAX_PRECISION; len++) {
		if (geohash_cell_height(len) < height && geohash_cell_width(len) < width) {
			return len;
		}
	}

	return GEOHASH_MAX_PRECISION;
}

/**
 * The adjacent cell of the same length in the given direction, computed
 * from the string alone. Longitude wraps around at the antimeridian.
 * An empty or invalid hash has no neighbors, and an empty string is returned.
 */
std::string geohash_neighbor(std::string const &hash, geohash_direction dir) {
	if (hash.size() == 0) {
		return "";
	}

	char last = hash[hash.size() - 1];
	int parity = hash.size() % 2;
	std::string parent = hash.substr(0, hash.size() - 1);

	const char *found = strchr(neighbors[dir][parity], last);
	if (last == '\0' || found == NULL) {
		return "";
	}

	if (strchr(borders[dir][parity], last) != NULL && parent.size() > 0) {
		parent = geohash_neighbor(parent, dir);
		if (parent.size() == 0) {
			return "";
		}
	}

	return parent + base32[found - neighbors[dir][parity]];
}
