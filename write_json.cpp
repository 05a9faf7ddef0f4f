#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <math.h>
#include <cmath>
#include "write_json.hpp"
#include "csv.hpp"
#include "errors.hpp"

std::string json_quote(std::string const &s) {
	std::string out = "\"";

	for (size_t i = 0; i < s.size(); i++) {
		unsigned char c = s[i];

		if (c == '"' || c == '\\') {
			out.push_back('\\');
			out.push_back(c);
		} else if (c == '\n') {
			out.append("\\n");
		} else if (c == '\r') {
			out.append("\\r");
		} else if (c == '\t') {
			out.append("\\t");
		} else if (c < ' ') {
			char tmp[7];
			snprintf(tmp, sizeof(tmp), "\\u%04x", c);
			out.append(tmp);
		} else {
			out.push_back(c);
		}
	}

	out.push_back('"');
	return out;
}

std::string point_count_abbreviated(long long point_count) {
	char abbrev[20];  // to_string(LLONG_MAX).length() / 1000 + 1;

	if (point_count >= 10000) {
		snprintf(abbrev, sizeof(abbrev), "%.0fk", point_count / 1000.0);
	} else if (point_count >= 1000) {
		snprintf(abbrev, sizeof(abbrev), "%.1fk", point_count / 1000.0);
	} else {
		snprintf(abbrev, sizeof(abbrev), "%lld", point_count);
	}

	return abbrev;
}

static std::string json_coordinate(double d) {
	char tmp[50];
	snprintf(tmp, sizeof(tmp), "%.6f", d);
	return tmp;
}

// A single point keeps its own id and attributes. A cluster gets
// the attributes that describe its size instead.
std::string geojson_feature(point_group const &g) {
	std::string out = "{\"type\":\"Feature\"";

	if (!g.clustered() && g.members.size() == 1 && g.members[0].has_id) {
		out.append(",\"id\":");
		out.append(std::to_string(g.members[0].id));
	}

	out.append(",\"properties\":{");

	if (g.clustered()) {
		long long point_count = g.count;

		out.append("\"clustered\":true");
		out.append(",\"point_count\":" + std::to_string(point_count));

		char sqrt_count[50];
		snprintf(sqrt_count, sizeof(sqrt_count), "%g", round(100 * sqrt(point_count)) / 100.0);
		out.append(",\"sqrt_point_count\":" + std::string(sqrt_count));

		out.append(",\"point_count_abbreviated\":" + json_quote(point_count_abbreviated(point_count)));
	} else if (g.members.size() == 1) {
		member_feature const &m = g.members[0];

		for (size_t i = 0; i < m.keys.size() && i < m.values.size(); i++) {
			if (i != 0) {
				out.push_back(',');
			}

			out.append(json_quote(m.keys[i]));
			out.push_back(':');
			if (is_number(m.values[i])) {
				out.append(m.values[i]);
			} else {
				out.append(json_quote(m.values[i]));
			}
		}
	}

	lonlat const &p = g.representative();
	out.append("},\"geometry\":{\"type\":\"Point\",\"coordinates\":[");
	out.append(json_coordinate(p.lon));
	out.push_back(',');
	out.append(json_coordinate(p.lat));
	out.append("]}}");

	return out;
}

static void fwrite_check(const char *p, size_t len, FILE *fp, const char *fname) {
	if (fwrite(p, sizeof(char), len, fp) != len) {
		fprintf(stderr, "%s: Write failed: %s\n", fname, strerror(errno));
		exit(EXIT_WRITE);
	}
}

void write_geojson(FILE *fp, std::vector<point_group> const &groups, const char *fname) {
	std::string s = "{\"type\":\"FeatureCollection\",\"features\":[\n";
	fwrite_check(s.c_str(), s.size(), fp, fname);

	for (size_t i = 0; i < groups.size(); i++) {
		s = geojson_feature(groups[i]);
		if (i + 1 < groups.size()) {
			s.push_back(',');
		}
		s.push_back('\n');
		fwrite_check(s.c_str(), s.size(), fp, fname);
	}

	s = "]}\n";
	fwrite_check(s.c_str(), s.size(), fp, fname);
}
