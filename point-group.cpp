#include <stdio.h>
#include <stdlib.h>
#include <math.h>
#include <cmath>
#include <utility>
#include "point-group.hpp"
#include "errors.hpp"

static void check_point(point_group const &g, const char *what) {
	if (!g.has_point || g.count == 0 || !std::isfinite(g.point.lon) || !std::isfinite(g.point.lat)) {
		fprintf(stderr, "Internal error: %s point group of %zu has no valid representative point\n", what, g.count);
		exit(EXIT_IMPOSSIBLE);
	}
}

lonlat const &point_group::representative() const {
	check_point(*this, "queried");
	return point;
}

// Absorb `other` into this group. `other` is left empty and must not
// be used again except to be discarded.
void point_group::merge_in(point_group &other) {
	check_point(*this, "merging");
	check_point(other, "merged");

	double total = count + other.count;
	point.lon = (point.lon * count + other.point.lon * other.count) / total;
	point.lat = (point.lat * count + other.point.lat * other.count) / total;

	for (auto &m : other.members) {
		members.push_back(std::move(m));
	}
	count += other.count;

	other.members.clear();
	other.count = 0;
	other.has_point = false;

	check_point(*this, "merged");
}
