#include <stdio.h>
#include <stdlib.h>
#include <math.h>
#include <cmath>
#include <string>
#include <stdexcept>
#include "geohash-lengths.hpp"
#include "geohash.hpp"
#include "errors.hpp"

/**
 * Geohash length to cluster by for a distance in pixels at the given
 * resolution: the shortest length whose cells are smaller than the
 * distance in both directions.
 */
int length_from_distance(double resolution, double distance_threshold) {
	// the number of meters we'd like to keep markers apart
	double cluster_distance_meters = distance_threshold * resolution;

	double width, height;
	epsg3857tolonlat(cluster_distance_meters, cluster_distance_meters, &width, &height);

	return geohash_length_for_bbox(width, height);
}

static std::vector<int> precompute_geohash_lengths(resolution_table const &rt, int distance_threshold) {
	std::vector<int> out;

	for (int z = 0; z < ZOOMS; z++) {
		double resolution = rt.resolution(z);
		if (!std::isfinite(resolution) || resolution <= 0) {
			throw std::runtime_error("resolution at zoom " + std::to_string(z) + " is not a positive number");
		}

		out.push_back(length_from_distance(resolution, distance_threshold));
	}

	return out;
}

geohash_length_cache::geohash_length_cache(resolution_table const &rt) {
	if (pthread_mutex_init(&lock, NULL) != 0) {
		perror("pthread_mutex_init");
		exit(EXIT_PTHREAD);
	}

	tables.emplace(GEOCLUSTER_DEFAULT_DISTANCE, precompute_geohash_lengths(rt, GEOCLUSTER_DEFAULT_DISTANCE));
	computed++;
}

geohash_length_cache::~geohash_length_cache() {
	pthread_mutex_destroy(&lock);
}

std::vector<int> const &geohash_length_cache::get(resolution_table const &rt, int distance_threshold) {
	if (pthread_mutex_lock(&lock) != 0) {
		perror("pthread_mutex_lock");
		exit(EXIT_PTHREAD);
	}

	auto f = tables.find(distance_threshold);
	if (f == tables.end()) {
		if (distance_threshold < MIN_DISTANCE_THRESHOLD || distance_threshold > MAX_DISTANCE_THRESHOLD) {
			if (pthread_mutex_unlock(&lock) != 0) {
				perror("pthread_mutex_unlock");
				exit(EXIT_PTHREAD);
			}

			throw threshold_out_of_range(distance_threshold, "distance threshold " + std::to_string(distance_threshold) + " is outside the allowed range " + std::to_string(MIN_DISTANCE_THRESHOLD) + ".." + std::to_string(MAX_DISTANCE_THRESHOLD));
		}

		try {
			f = tables.emplace(distance_threshold, precompute_geohash_lengths(rt, distance_threshold)).first;
		} catch (...) {
			if (pthread_mutex_unlock(&lock) != 0) {
				perror("pthread_mutex_unlock");
				exit(EXIT_PTHREAD);
			}
			throw;
		}
		computed++;
	}

	if (pthread_mutex_unlock(&lock) != 0) {
		perror("pthread_mutex_unlock");
		exit(EXIT_PTHREAD);
	}

	return f->second;
}

// The process-wide cache, which starts out with the table for the default threshold
geohash_length_cache &geohash_lengths() {
	static geohash_length_cache cache(resolutions);
	return cache;
}

std::vector<int> const &length_for_distance_threshold(resolution_table const &rt, int distance_threshold) {
	return geohash_lengths().get(rt, distance_threshold);
}
