#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <sys/types.h>
#include <math.h>
#include <cmath>
#include <cctype>
#include <string>
#include <vector>
#include <algorithm>
#include <zlib.h>
#include "geocsv.hpp"
#include "csv.hpp"
#include "text.hpp"
#include "errors.hpp"

// Read points from a CSV file with a header line naming its columns.
// An empty `fname` means the standard input. zlib reads uncompressed
// input as is, so gzipped and plain files go through the same path.
void parse_geocsv(std::vector<member_feature> &out, std::string fname) {
	gzFile f;

	if (fname.size() == 0) {
		f = gzdopen(0, "rb");
		fname = "standard input";
	} else {
		f = gzopen(fname.c_str(), "rb");
	}
	if (f == NULL) {
		fprintf(stderr, "%s: %s\n", fname.c_str(), errno != 0 ? strerror(errno) : "out of memory");
		exit(EXIT_OPEN);
	}

	std::string s;
	std::vector<std::string> header;
	ssize_t latcol = -1, loncol = -1, idcol = -1;

	if ((s = csv_getline(f)).size() > 0) {
		std::string err = check_utf8(s);
		if (err != "") {
			fprintf(stderr, "%s: %s\n", fname.c_str(), err.c_str());
			exit(EXIT_UTF8);
		}

		header = csv_split(s.c_str());

		for (size_t i = 0; i < header.size(); i++) {
			header[i] = csv_dequote(header[i]);

			std::string lower(header[i]);
			std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

			if (lower == "y" || lower == "lat" || (lower.find("latitude") != std::string::npos)) {
				latcol = i;
			}
			if (lower == "x" || lower == "lon" || lower == "lng" || lower == "long" || (lower.find("longitude") != std::string::npos)) {
				loncol = i;
			}
			if (lower == "id") {
				idcol = i;
			}
		}
	}

	if (latcol < 0 || loncol < 0) {
		fprintf(stderr, "%s: Can't find \"lat\" and \"lon\" columns\n", fname.c_str());
		exit(EXIT_CSV);
	}

	size_t seq = 0;
	while ((s = csv_getline(f)).size() > 0) {
		std::string err = check_utf8(s);
		if (err != "") {
			fprintf(stderr, "%s: %s\n", fname.c_str(), err.c_str());
			exit(EXIT_UTF8);
		}

		seq++;
		std::vector<std::string> line = csv_split(s.c_str());

		if (line.size() != header.size()) {
			fprintf(stderr, "%s:%zu: Mismatched column count: %zu in line, %zu in header\n", fname.c_str(), seq + 1, line.size(), header.size());
			exit(EXIT_CSV);
		}

		std::string lonstr = csv_dequote(line[loncol]);
		std::string latstr = csv_dequote(line[latcol]);
		double lon = atof(lonstr.c_str());
		double lat = atof(latstr.c_str());

		if (lonstr.empty() || latstr.empty() || !std::isfinite(lon) || !std::isfinite(lat)) {
			static int warned = 0;
			if (!warned) {
				fprintf(stderr, "%s:%zu: null geometry (additional not reported)\n", fname.c_str(), seq + 1);
				warned = 1;
			}
			continue;
		}

		member_feature mf;
		mf.where = lonlat(lon, lat);

		for (size_t i = 0; i < line.size(); i++) {
			if (i == (size_t) latcol || i == (size_t) loncol) {
				continue;
			}

			line[i] = csv_dequote(line[i]);

			if (i == (size_t) idcol && line[i].size() > 0 && line[i].find_first_not_of("0123456789") == std::string::npos) {
				mf.has_id = true;
				mf.id = strtoull(line[i].c_str(), NULL, 10);
				continue;
			}

			mf.keys.push_back(header[i]);
			mf.values.push_back(line[i]);
		}

		out.push_back(mf);
	}

	int errnum;
	const char *msg = gzerror(f, &errnum);
	if (errnum != Z_OK) {
		fprintf(stderr, "%s: %s\n", fname.c_str(), errnum == Z_ERRNO ? strerror(errno) : msg);
		exit(EXIT_READ);
	}

	int ret = gzclose(f);
	if (ret != Z_OK) {
		fprintf(stderr, "%s: gzclose failed: %d\n", fname.c_str(), ret);
		exit(EXIT_CLOSE);
	}
}
