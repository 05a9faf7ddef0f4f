#ifndef POINT_GROUP_HPP
#define POINT_GROUP_HPP

#include <stddef.h>
#include <string>
#include <vector>
#include "distance.hpp"

// One of the original input points, carried through clustering unchanged.
// The keys and values are whatever attributes came with the point;
// clustering never looks at them.
struct member_feature {
	bool has_id = false;
	unsigned long long id = 0;

	lonlat where;

	std::vector<std::string> keys{};
	std::vector<std::string> values{};
};

// Either a single point or a cluster of points that have been merged.
// `point` is the representative location: the count-weighted mean of
// the representative locations of everything merged into it.
struct point_group {
	lonlat point;
	bool has_point = false;

	std::vector<member_feature> members{};
	size_t count = 0;

	point_group() {
	}

	point_group(member_feature const &f)
	    : point(f.where), has_point(true), count(1) {
		members.push_back(f);
	}

	bool clustered() const {
		return count > 1;
	}

	lonlat const &representative() const;
	void merge_in(point_group &other);
};

#endif
