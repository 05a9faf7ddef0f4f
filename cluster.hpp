#ifndef CLUSTER_HPP
#define CLUSTER_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "point-group.hpp"

// Point groups keyed by geohash prefix. This has to be an ordered map:
// the neighbor check depends on visiting the prefixes in ascending order.
typedef std::map<std::string, std::shared_ptr<point_group>> geohash_groups;

std::vector<std::string> top_right_neighbors(std::string const &hash);

void merge_by_neighbor_check(geohash_groups &groups, int zoom);
void merge_by_neighbor_check(geohash_groups &groups, int zoom, int distance_threshold);

geohash_groups bucket_by_geohash(std::vector<member_feature> const &points, size_t hash_len);
std::vector<point_group> cluster_points(std::vector<member_feature> const &points, int zoom, int distance_threshold, bool merge_at_threshold = false);

#endif
