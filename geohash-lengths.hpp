#ifndef GEOHASH_LENGTHS_HPP
#define GEOHASH_LENGTHS_HPP

#include <stddef.h>
#include <pthread.h>
#include <map>
#include <vector>
#include "projection.hpp"

// Distance in pixels below which points are clustered together
#define GEOCLUSTER_DEFAULT_DISTANCE 65

// Range of thresholds that may be cached: 8 through 260 with the default of 65
#define MIN_DISTANCE_THRESHOLD (GEOCLUSTER_DEFAULT_DISTANCE / 8)
#define MAX_DISTANCE_THRESHOLD (GEOCLUSTER_DEFAULT_DISTANCE * 4)

int length_from_distance(double resolution, double distance_threshold);

// For each distance threshold that has been asked for, the geohash prefix
// length to bucket points by at each zoom level. A table is never changed
// once it has been added, so references to it stay good for the life of
// the cache.
struct geohash_length_cache {
	std::map<int, std::vector<int>> tables;
	pthread_mutex_t lock;

	// number of tables that have been computed, including the default one
	size_t computed = 0;

	geohash_length_cache(resolution_table const &rt);
	~geohash_length_cache();

	std::vector<int> const &get(resolution_table const &rt, int distance_threshold);
};

geohash_length_cache &geohash_lengths();
std::vector<int> const &length_for_distance_threshold(resolution_table const &rt, int distance_threshold);

#endif
