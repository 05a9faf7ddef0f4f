#include <stdio.h>
#include <set>
#include <memory>
#include <utility>
#include "cluster.hpp"
#include "geohash.hpp"
#include "geohash-lengths.hpp"
#include "projection.hpp"
#include "distance.hpp"

// Only the neighbors above and to the right: because of the way geohashes
// are structured, the prefixes that come later in sorted order are always
// to the top, top right, or right.
std::vector<std::string> top_right_neighbors(std::string const &hash) {
	std::vector<std::string> out;

	std::string top = geohash_neighbor(hash, geohash_top);
	out.push_back(geohash_neighbor(top, geohash_left));
	out.push_back(top);
	out.push_back(geohash_neighbor(top, geohash_right));
	out.push_back(geohash_neighbor(hash, geohash_right));

	return out;
}

void merge_by_neighbor_check(geohash_groups &groups, int zoom) {
	merge_by_neighbor_check(groups, zoom, GEOCLUSTER_DEFAULT_DISTANCE);
}

/**
 * Create the final clusters by merging each group with any of its
 * top right neighbors that are close enough to it on screen.
 *
 * Each neighbor is checked against the group's position from before the
 * merges, not against the moving centroid.
 *
 * This is a single pass. A group that gets merged away is not visited
 * later, so its own neighbors are not checked against the group that
 * absorbed it, and clustering is not transitive.
 *
 * Merged groups are only erased from `groups` after the whole pass,
 * so the iteration is never disturbed.
 */
void merge_by_neighbor_check(geohash_groups &groups, int zoom, int distance_threshold) {
	double resolution = resolutions.resolution(zoom);
	std::set<std::string> removed;

	for (auto &kv : groups) {
		if (removed.count(kv.first) > 0) {
			continue;
		}

		point_group *item = kv.second.get();
		if (item == NULL) {
			continue;
		}

		lonlat here = item->representative();

		for (auto const &other_hash : top_right_neighbors(kv.first)) {
			if (other_hash == kv.first || removed.count(other_hash) > 0) {
				continue;
			}

			auto f = groups.find(other_hash);
			if (f == groups.end() || !f->second) {
				continue;
			}

			if (should_cluster(here, f->second->representative(), resolution, distance_threshold)) {
				item->merge_in(*f->second);
				removed.insert(other_hash);
			}
		}
	}

	for (auto const &hash : removed) {
		groups.erase(hash);
	}
}

// Points that fall within the same geohash prefix start out in the same group
geohash_groups bucket_by_geohash(std::vector<member_feature> const &points, size_t hash_len) {
	geohash_groups groups;

	for (auto const &p : points) {
		std::string hash = geohash_encode(p.where.lon, p.where.lat, hash_len);

		auto f = groups.find(hash);
		if (f != groups.end() && f->second) {
			point_group g(p);
			f->second->merge_in(g);
		} else {
			groups[hash] = std::make_shared<point_group>(p);
		}
	}

	return groups;
}

/**
 * Cluster `points` as they would be seen at `zoom`.
 *
 * `distance_threshold` chooses how coarsely points are bucketed by geohash.
 * The neighbor check uses the default distance unless `merge_at_threshold`
 * is set, in which case it uses `distance_threshold` too.
 *
 * Throws std::out_of_range for a bad zoom and threshold_out_of_range for a
 * threshold that can't be cached.
 */
std::vector<point_group> cluster_points(std::vector<member_feature> const &points, int zoom, int distance_threshold, bool merge_at_threshold) {
	resolutions.resolution(zoom);  // reject a bad zoom before anything else
	std::vector<int> const &lengths = length_for_distance_threshold(resolutions, distance_threshold);

	geohash_groups groups = bucket_by_geohash(points, lengths[zoom]);

	if (merge_at_threshold) {
		merge_by_neighbor_check(groups, zoom, distance_threshold);
	} else {
		merge_by_neighbor_check(groups, zoom);
	}

	std::vector<point_group> out;
	for (auto &kv : groups) {
		if (kv.second) {
			out.push_back(std::move(*kv.second));
		}
	}

	return out;
}
