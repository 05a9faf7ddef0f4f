#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <getopt.h>
#include <string>
#include <vector>
#include <stdexcept>
#include "cluster.hpp"
#include "geocsv.hpp"
#include "geohash-lengths.hpp"
#include "projection.hpp"
#include "write_json.hpp"
#include "text.hpp"
#include "errors.hpp"

int quiet = 0;

void usage(char **argv) {
	fprintf(stderr, "Usage: %s [-q] [-m] [-z zoom] [-r distance] [-o out.geojson] [file.csv ...]\n", argv[0]);
	exit(EXIT_ARGS);
}

int main(int argc, char **argv) {
	int zoom = 10;
	int distance = GEOCLUSTER_DEFAULT_DISTANCE;
	int merge_at_threshold = 0;
	const char *outfile = NULL;

	struct option long_options[] = {
		{"output", required_argument, 0, 'o'},
		{"zoom", required_argument, 0, 'z'},
		{"cluster-distance", required_argument, 0, 'r'},
		{"merge-at-threshold", no_argument, 0, 'm'},
		{"quiet", no_argument, 0, 'q'},
		{"help", no_argument, 0, 'H'},

		{0, 0, 0, 0},
	};

	std::string getopt_str;
	for (size_t lo = 0; long_options[lo].name != NULL; lo++) {
		if (long_options[lo].val > ' ') {
			getopt_str.push_back(long_options[lo].val);

			if (long_options[lo].has_arg == required_argument) {
				getopt_str.push_back(':');
			}
		}
	}

	extern int optind;
	extern char *optarg;
	int i;

	int option_index = 0;
	while ((i = getopt_long(argc, argv, getopt_str.c_str(), long_options, &option_index)) != -1) {
		switch (i) {
		case 0:
			break;

		case 'o':
			outfile = optarg;
			break;

		case 'z':
			zoom = integer_arg("--zoom", optarg);
			break;

		case 'r':
			distance = integer_arg("--cluster-distance", optarg);
			break;

		case 'm':
			merge_at_threshold = 1;
			break;

		case 'q':
			quiet = 1;
			break;

		default:
			usage(argv);
		}
	}

	// computes the table for the default distance
	geohash_lengths();

	size_t hash_len = 0;
	try {
		resolutions.resolution(zoom);
		hash_len = length_for_distance_threshold(resolutions, distance)[zoom];
	} catch (std::out_of_range const &e) {
		// bad zoom, or a threshold_out_of_range
		fprintf(stderr, "%s: %s\n", argv[0], e.what());
		exit(EXIT_ARGS);
	}

	std::vector<member_feature> points;
	if (optind == argc) {
		parse_geocsv(points, "");
	} else {
		for (i = optind; i < argc; i++) {
			parse_geocsv(points, argv[i]);
		}
	}

	if (!quiet) {
		fprintf(stderr, "%zu points, clustering at zoom %d by geohash length %zu\n", points.size(), zoom, hash_len);
	}

	std::vector<point_group> groups = cluster_points(points, zoom, distance, merge_at_threshold);

	FILE *fp = stdout;
	if (outfile != NULL) {
		fp = fopen(outfile, "w");
		if (fp == NULL) {
			perror(outfile);
			exit(EXIT_OPEN);
		}
	}

	write_geojson(fp, groups, outfile != NULL ? outfile : "standard output");

	if (fclose(fp) != 0) {
		perror("fclose");
		exit(EXIT_CLOSE);
	}

	if (!quiet) {
		fprintf(stderr, "%zu groups written\n", groups.size());
	}

	return 0;
}
