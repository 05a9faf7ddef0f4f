#ifndef DISTANCE_HPP
#define DISTANCE_HPP

struct lonlat {
	double lon = 0;
	double lat = 0;

	lonlat() {
	}

	lonlat(double lon_, double lat_)
	    : lon(lon_), lat(lat_) {
	}
};

double earth_diameter(double lat);
double haversine(double lat1, double lon1, double lat2, double lon2);

double pixel_correction(double lat);
double distance_pixels(lonlat const &a, lonlat const &b, double resolution);
bool should_cluster(lonlat const &a, lonlat const &b, double resolution, double distance_threshold);

#endif
