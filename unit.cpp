#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <math.h>
#include <cmath>
#include <stdexcept>
#include <algorithm>
#include <memory>
#include <pthread.h>
#include <zlib.h>
#include "projection.hpp"
#include "distance.hpp"
#include "geohash.hpp"
#include "geohash-lengths.hpp"
#include "point-group.hpp"
#include "cluster.hpp"
#include "csv.hpp"
#include "geocsv.hpp"
#include "text.hpp"
#include "write_json.hpp"
#include "errors.hpp"

static member_feature mock_point(double lon, double lat, unsigned long long id) {
	member_feature mf;
	mf.where = lonlat(lon, lat);
	mf.has_id = true;
	mf.id = id;
	mf.keys.push_back("name");
	mf.values.push_back("point " + std::to_string(id));
	return mf;
}

static std::shared_ptr<point_group> mock_group(double lon, double lat, unsigned long long id) {
	return std::make_shared<point_group>(mock_point(lon, lat, id));
}

TEST_CASE("Zoom resolutions", "[resolution]") {
	REQUIRE(resolutions.resolution(0) == Approx(156543.03392804097));
	REQUIRE(resolutions.resolution(10) == Approx(152.8740565703525));

	for (int z = 0; z <= MAX_ZOOM; z++) {
		REQUIRE(resolutions.resolution(z) == resolutions.resolution(0) / std::pow(2, z));
		if (z > 0) {
			REQUIRE(resolutions.resolution(z) < resolutions.resolution(z - 1));
		}
	}

	REQUIRE_THROWS_AS(resolutions.resolution(-1), std::out_of_range);
	REQUIRE_THROWS_AS(resolutions.resolution(MAX_ZOOM + 1), std::out_of_range);
}

TEST_CASE("Spherical Mercator to degrees", "[projection]") {
	double lon, lat;

	epsg3857tolonlat(0, 0, &lon, &lat);
	REQUIRE(lon == 0.0);
	REQUIRE(lat == 0.0);

	epsg3857tolonlat(20037508.342789244, 20037508.342789244, &lon, &lat);
	REQUIRE(lon == Approx(180.0));
	REQUIRE(lat == Approx(85.0511287798));

	epsg3857tolonlat(-20037508.342789244, -20037508.342789244, &lon, &lat);
	REQUIRE(lon == Approx(-180.0));
	REQUIRE(lat == Approx(-85.0511287798));
}

TEST_CASE("Great-circle distance", "[distance]") {
	REQUIRE(earth_diameter(0) == Approx(12756.274));
	REQUIRE(earth_diameter(90) == Approx(2 * 6356.7523142));

	// one degree of longitude along the equator
	REQUIRE(haversine(0, 0, 0, 1) == Approx(111319.49079326246));
	REQUIRE(haversine(37.77, -122.43, 37.77, -122.43) == 0);
}

TEST_CASE("Pixel distance", "[distance]") {
	REQUIRE(pixel_correction(0) == 1);
	REQUIRE(pixel_correction(47.9899) == Approx(335.0 / 223.271875276));
	REQUIRE(pixel_correction(-30) == pixel_correction(30));
	REQUIRE(pixel_correction(60) > pixel_correction(30));

	lonlat sf(-122.43, 37.77);
	lonlat equator(-122.43, 0);
	for (int z = 0; z <= MAX_ZOOM; z++) {
		REQUIRE(distance_pixels(sf, sf, resolutions.resolution(z)) == 0);
		REQUIRE(should_cluster(sf, sf, resolutions.resolution(z), 1));
	}

	// only the first point's latitude is corrected for
	REQUIRE(distance_pixels(sf, equator, resolutions.resolution(4)) > distance_pixels(equator, sf, resolutions.resolution(4)));

	lonlat a(-122.43, 37.77), b(-122.37, 37.77), c(-122.31, 37.77);
	REQUIRE(distance_pixels(a, b, resolutions.resolution(10)) == Approx(48.078).epsilon(0.001));
	REQUIRE(should_cluster(a, b, resolutions.resolution(10), GEOCLUSTER_DEFAULT_DISTANCE));
	REQUIRE(!should_cluster(a, c, resolutions.resolution(10), GEOCLUSTER_DEFAULT_DISTANCE));
	REQUIRE(should_cluster(a, c, resolutions.resolution(11), 4 * GEOCLUSTER_DEFAULT_DISTANCE));
}

TEST_CASE("Geohash encoding", "[geohash]") {
	REQUIRE(geohash_encode(-122.4194, 37.7749, 5) == "9q8yy");
	REQUIRE(geohash_encode(-77.0365, 38.8977, 9) == "dqcjqcpex");
	REQUIRE(geohash_encode(-73.9857, 40.7484, 5) == "dr5ru");
	REQUIRE(geohash_encode(0, 0, 0) == "");

	double minlon, minlat, maxlon, maxlat;
	REQUIRE(geohash_bbox("9q8yy", &minlon, &minlat, &maxlon, &maxlat));
	REQUIRE(minlon == -122.431640625);
	REQUIRE(maxlon == -122.3876953125);
	REQUIRE(minlat == 37.7490234375);
	REQUIRE(maxlat == 37.79296875);

	REQUIRE(!geohash_bbox("9q8ya", &minlon, &minlat, &maxlon, &maxlat));
}

TEST_CASE("Geohash neighbors", "[geohash]") {
	REQUIRE(geohash_neighbor("dqcjq", geohash_top) == "dqcjw");
	REQUIRE(geohash_neighbor("dqcjq", geohash_right) == "dqcjr");
	REQUIRE(geohash_neighbor("dqcjq", geohash_left) == "dqcjm");
	REQUIRE(geohash_neighbor("dqcjq", geohash_bottom) == "dqcjn");

	// crossing into the next parent cell
	REQUIRE(geohash_neighbor("9q8yz", geohash_right) == "9q9nb");
	REQUIRE(geohash_neighbor("9q8yz", geohash_left) == "9q8yy");

	// longitude wraps around the antimeridian
	REQUIRE(geohash_neighbor("0", geohash_right) == "1");
	REQUIRE(geohash_neighbor("z", geohash_right) == "b");
	REQUIRE(geohash_neighbor("b", geohash_left) == "z");

	REQUIRE(geohash_neighbor("", geohash_top) == "");
	REQUIRE(geohash_neighbor("9q8ya", geohash_top) == "");

	std::vector<std::string> expected = {"9q8zj", "9q8zn", "9q8zp", "9q8yz"};
	REQUIRE(top_right_neighbors("9q8yy") == expected);
}

TEST_CASE("Geohash length for a cell size", "[geohash]") {
	REQUIRE(geohash_cell_width(1) == 45);
	REQUIRE(geohash_cell_height(1) == 45);
	REQUIRE(geohash_cell_width(2) == 11.25);
	REQUIRE(geohash_cell_height(2) == 5.625);
	REQUIRE(geohash_cell_width(5) == 0.0439453125);

	REQUIRE(geohash_length_for_bbox(360, 180) == 1);
	REQUIRE(geohash_length_for_bbox(45.1, 45.1) == 1);
	REQUIRE(geohash_length_for_bbox(45, 45) == 2);
	REQUIRE(geohash_length_for_bbox(0.05, 0.05) == 5);
	REQUIRE(geohash_length_for_bbox(0, 0) == GEOHASH_MAX_PRECISION);
}

TEST_CASE("Geohash lengths for distance thresholds", "[lengths]") {
	REQUIRE(length_from_distance(resolutions.resolution(10), GEOCLUSTER_DEFAULT_DISTANCE) == 5);

	std::vector<int> expected_default = {1, 2, 2, 2, 3, 3, 3, 4, 4, 5, 5, 5, 6, 6, 7, 7, 7, 8, 8, 9, 9, 9, 10, 10, 11, 11, 11, 12, 12, 13, 13};
	// at 8 pixels the distance lands exactly on a cell width at every zoom,
	// so the strict comparison pushes each length one longer
	std::vector<int> expected_min = {3, 3, 3, 4, 4, 5, 5, 5, 6, 6, 7, 7, 7, 8, 8, 9, 9, 9, 10, 10, 11, 11, 11, 12, 12, 13, 13, 13, 14, 14, 15};
	std::vector<int> expected_max = {1, 1, 1, 2, 2, 2, 3, 3, 3, 4, 4, 5, 5, 5, 6, 6, 7, 7, 7, 8, 8, 9, 9, 9, 10, 10, 11, 11, 11, 12, 12};

	geohash_length_cache cache(resolutions);
	REQUIRE(cache.computed == 1);
	REQUIRE(cache.tables.size() == 1);
	REQUIRE(cache.get(resolutions, GEOCLUSTER_DEFAULT_DISTANCE) == expected_default);
	REQUIRE(cache.computed == 1);

	std::vector<int> const &first = cache.get(resolutions, 100);
	REQUIRE(cache.computed == 2);
	std::vector<int> const &second = cache.get(resolutions, 100);
	REQUIRE(cache.computed == 2);
	REQUIRE(&first == &second);
	REQUIRE(first == second);
	REQUIRE(first.size() == ZOOMS);

	for (size_t z = 1; z < first.size(); z++) {
		REQUIRE(first[z] >= first[z - 1]);
	}

	REQUIRE(MIN_DISTANCE_THRESHOLD == 8);
	REQUIRE(MAX_DISTANCE_THRESHOLD == 260);
	REQUIRE(cache.get(resolutions, MIN_DISTANCE_THRESHOLD) == expected_min);
	REQUIRE(cache.get(resolutions, MAX_DISTANCE_THRESHOLD) == expected_max);
	REQUIRE(cache.computed == 4);

	REQUIRE_THROWS_AS(cache.get(resolutions, MIN_DISTANCE_THRESHOLD - 1), threshold_out_of_range);
	REQUIRE_THROWS_AS(cache.get(resolutions, MAX_DISTANCE_THRESHOLD + 1), threshold_out_of_range);
	REQUIRE_THROWS_AS(cache.get(resolutions, 0), std::out_of_range);
	REQUIRE(cache.computed == 4);
	REQUIRE(cache.tables.size() == 4);

	// the process-wide cache starts out with the default table
	REQUIRE(length_for_distance_threshold(resolutions, GEOCLUSTER_DEFAULT_DISTANCE) == expected_default);
	REQUIRE(&length_for_distance_threshold(resolutions, 50) == &length_for_distance_threshold(resolutions, 50));
	REQUIRE(geohash_lengths().tables.count(GEOCLUSTER_DEFAULT_DISTANCE) == 1);
}

struct cache_arg {
	geohash_length_cache *cache;
	std::vector<int> const *table;
};

static void *run_cache_get(void *v) {
	cache_arg *a = (cache_arg *) v;
	a->table = &a->cache->get(resolutions, 120);
	return NULL;
}

TEST_CASE("Geohash length tables are computed once across threads", "[lengths]") {
	geohash_length_cache cache(resolutions);
	REQUIRE(cache.computed == 1);

	const size_t CPUS = 8;
	pthread_t pthreads[CPUS];
	cache_arg args[CPUS];

	for (size_t i = 0; i < CPUS; i++) {
		args[i].cache = &cache;
		args[i].table = NULL;
		REQUIRE(pthread_create(&pthreads[i], NULL, run_cache_get, &args[i]) == 0);
	}

	for (size_t i = 0; i < CPUS; i++) {
		void *retval;
		REQUIRE(pthread_join(pthreads[i], &retval) == 0);
	}

	REQUIRE(cache.computed == 2);
	REQUIRE(cache.tables.size() == 2);
	for (size_t i = 0; i < CPUS; i++) {
		REQUIRE(args[i].table == &cache.tables[120]);
	}
}

TEST_CASE("A failed table computation releases the cache", "[lengths]") {
	geohash_length_cache cache(resolutions);

	resolution_table broken = resolutions;
	broken.resolutions[3] = 0;
	REQUIRE_THROWS_AS(cache.get(broken, 100), std::runtime_error);
	REQUIRE(cache.computed == 1);
	REQUIRE(cache.tables.count(100) == 0);

	// a lock left held here would hang this call
	REQUIRE(cache.get(resolutions, 100).size() == ZOOMS);
	REQUIRE(cache.computed == 2);
}

TEST_CASE("Point group merging", "[group]") {
	point_group a(mock_point(-122.39, 37.79, 1));
	point_group b(mock_point(-122.385, 37.79, 2));
	point_group c(mock_point(-122.39, 37.795, 3));

	REQUIRE(!a.clustered());
	REQUIRE(a.count == 1);

	a.merge_in(b);
	REQUIRE(a.count == 2);
	REQUIRE(a.clustered());
	REQUIRE(a.representative().lon == Approx(-122.3875));
	REQUIRE(a.representative().lat == Approx(37.79));
	REQUIRE(b.count == 0);
	REQUIRE(b.members.size() == 0);
	REQUIRE(!b.has_point);

	// the centroid is weighted by the number of points on each side
	a.merge_in(c);
	REQUIRE(a.count == 3);
	REQUIRE(a.representative().lon == Approx((-122.39 - 122.385 - 122.39) / 3));
	REQUIRE(a.representative().lat == Approx((37.79 + 37.79 + 37.795) / 3));

	REQUIRE(a.members.size() == 3);
	REQUIRE(a.members[0].id == 1);
	REQUIRE(a.members[1].id == 2);
	REQUIRE(a.members[2].id == 3);
	REQUIRE(a.members[2].values[0] == "point 3");
}

TEST_CASE("A single group is left alone", "[merge]") {
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.39, 37.79, 1);

	merge_by_neighbor_check(groups, 10);
	REQUIRE(groups.size() == 1);
	REQUIRE(groups["9q8yy"]->count == 1);
	REQUIRE(groups["9q8yy"]->representative().lon == -122.39);
}

TEST_CASE("Adjacent groups merge into the first", "[merge]") {
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.39, 37.79, 1);
	groups["9q8yz"] = mock_group(-122.385, 37.79, 2);
	groups["9q8zn"] = mock_group(-122.39, 37.795, 3);

	std::vector<std::string> keys;
	for (auto const &kv : groups) {
		keys.push_back(kv.first);
	}
	REQUIRE(std::is_sorted(keys.begin(), keys.end()));

	merge_by_neighbor_check(groups, 10);

	REQUIRE(groups.size() == 1);
	REQUIRE(groups.count("9q8yy") == 1);
	REQUIRE(groups.count("9q8yz") == 0);
	REQUIRE(groups.count("9q8zn") == 0);
	REQUIRE(groups["9q8yy"]->count == 3);
	REQUIRE(groups["9q8yy"]->members.size() == 3);
	REQUIRE(groups["9q8yy"]->representative().lon == Approx((-122.39 - 122.385 - 122.39) / 3));
	REQUIRE(groups["9q8yy"]->representative().lat == Approx((37.79 + 37.79 + 37.795) / 3));
}

TEST_CASE("Groups under prefixes that are not top right neighbors stay apart", "[merge]") {
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.39, 37.79, 1);
	groups["9q8yz"] = mock_group(-122.385, 37.79, 2);
	groups["9q8zy"] = mock_group(-122.39, 37.795, 3);

	merge_by_neighbor_check(groups, 10);

	REQUIRE(groups.size() == 2);
	REQUIRE(groups["9q8yy"]->count == 2);
	REQUIRE(groups["9q8zy"]->count == 1);
}

TEST_CASE("Merging is not transitive within a pass", "[merge]") {
	// a-b and b-c are within 65 pixels at z10, but a-c is not
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.43, 37.77, 1);
	groups["9q8yz"] = mock_group(-122.37, 37.77, 2);
	groups["9q9nb"] = mock_group(-122.31, 37.77, 3);

	merge_by_neighbor_check(groups, 10);

	REQUIRE(groups.size() == 2);
	REQUIRE(groups["9q8yy"]->count == 2);
	REQUIRE(groups.count("9q8yz") == 0);
	REQUIRE(groups["9q9nb"]->count == 1);
	REQUIRE(groups["9q9nb"]->members[0].id == 3);
}

TEST_CASE("Neighbors are compared against the position before merging", "[merge]") {
	// 57 and 45 pixels from the first group at z10, but the east one is 73
	// pixels from where the first group ends up after taking in the north-west one
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.40, 37.77, 1);
	groups["9q8zj"] = mock_group(-122.46, 37.80, 2);
	groups["9q8yz"] = mock_group(-122.35, 37.75, 3);

	lonlat here(-122.40, 37.77);
	REQUIRE(distance_pixels(here, lonlat(-122.46, 37.80), resolutions.resolution(10)) == Approx(56.88).epsilon(0.01));
	REQUIRE(distance_pixels(here, lonlat(-122.35, 37.75), resolutions.resolution(10)) == Approx(44.91).epsilon(0.01));
	REQUIRE(!should_cluster(lonlat(-122.43, 37.785), lonlat(-122.35, 37.75), resolutions.resolution(10), GEOCLUSTER_DEFAULT_DISTANCE));

	merge_by_neighbor_check(groups, 10);

	REQUIRE(groups.size() == 1);
	REQUIRE(groups["9q8yy"]->count == 3);
	REQUIRE(groups["9q8yy"]->members[1].id == 2);
	REQUIRE(groups["9q8yy"]->members[2].id == 3);
}

TEST_CASE("Merge distance threshold", "[merge]") {
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.43, 37.77, 1);
	groups["9q8yz"] = mock_group(-122.37, 37.77, 2);
	groups["9q9nb"] = mock_group(-122.31, 37.77, 3);

	merge_by_neighbor_check(groups, 10, MIN_DISTANCE_THRESHOLD);
	REQUIRE(groups.size() == 3);

	merge_by_neighbor_check(groups, 10, MAX_DISTANCE_THRESHOLD);
	REQUIRE(groups.size() == 2);
	REQUIRE(groups["9q8yy"]->count == 2);
}

TEST_CASE("Empty and bad input to the merge", "[merge]") {
	geohash_groups groups;
	groups["9q8yy"] = mock_group(-122.39, 37.79, 1);
	groups["9q8yz"] = nullptr;
	groups["9q8zn"] = mock_group(-122.39, 37.795, 3);

	merge_by_neighbor_check(groups, 10);
	REQUIRE(groups.size() == 2);
	REQUIRE(!groups["9q8yz"]);
	REQUIRE(groups["9q8yy"]->count == 2);

	geohash_groups empty;
	merge_by_neighbor_check(empty, 10);
	REQUIRE(empty.size() == 0);

	REQUIRE_THROWS_AS(merge_by_neighbor_check(groups, MAX_ZOOM + 1), std::out_of_range);
	REQUIRE(groups.size() == 2);
}

TEST_CASE("Clustering points", "[cluster]") {
	std::vector<member_feature> points;
	points.push_back(mock_point(-122.39, 37.79, 1));
	points.push_back(mock_point(-122.385, 37.79, 2));
	points.push_back(mock_point(-122.39, 37.795, 3));
	points.push_back(mock_point(-73.9857, 40.7484, 4));
	points.push_back(mock_point(-73.9858, 40.7485, 5));

	geohash_groups buckets = bucket_by_geohash(points, 5);
	REQUIRE(buckets.size() == 4);
	REQUIRE(buckets["dr5ru"]->count == 2);

	std::vector<point_group> groups = cluster_points(points, 10, GEOCLUSTER_DEFAULT_DISTANCE);
	REQUIRE(groups.size() == 2);

	// in geohash order
	REQUIRE(groups[0].count == 3);
	REQUIRE(groups[0].members[0].id == 1);
	REQUIRE(groups[1].count == 2);
	REQUIRE(groups[1].members[1].id == 5);
	REQUIRE(groups[1].members[1].values[0] == "point 5");

	// at z20 the points are far apart on screen
	REQUIRE(cluster_points(points, 20, GEOCLUSTER_DEFAULT_DISTANCE).size() == 5);

	REQUIRE_THROWS_AS(cluster_points(points, 10, MAX_DISTANCE_THRESHOLD + 1), threshold_out_of_range);
	REQUIRE_THROWS_AS(cluster_points(points, -1, GEOCLUSTER_DEFAULT_DISTANCE), std::out_of_range);
	REQUIRE(cluster_points(std::vector<member_feature>(), 10, GEOCLUSTER_DEFAULT_DISTANCE).size() == 0);
}

TEST_CASE("UTF-8 enforcement", "[utf8]") {
	REQUIRE(check_utf8("") == std::string(""));
	REQUIRE(check_utf8("hello world") == std::string(""));
	REQUIRE(check_utf8("Καλημέρα κόσμε") == std::string(""));
	REQUIRE(check_utf8("こんにちは 世界") == std::string(""));
	REQUIRE(check_utf8("👋🌏") == std::string(""));
	REQUIRE(check_utf8("Hola m\xF3n") == std::string("\"Hola m\xF3n\" is not valid UTF-8 (0xF3 0x6E)"));
}

TEST_CASE("CSV fields", "[csv]") {
	std::vector<std::string> expected = {"a", "\"b,c\"", "", "d"};
	REQUIRE(csv_split("a,\"b,c\",,d\n") == expected);

	std::vector<std::string> trailing = {"a", ""};
	REQUIRE(csv_split("a,\r\n") == trailing);

	REQUIRE(csv_dequote("\"say \"\"hi\"\"\"") == "say \"hi\"");

	REQUIRE(is_number("0"));
	REQUIRE(is_number("-12.5e3"));
	REQUIRE(!is_number(""));
	REQUIRE(!is_number("01"));
	REQUIRE(!is_number(".5"));
	REQUIRE(!is_number("0x1A"));
	REQUIRE(!is_number("12 "));
	REQUIRE(!is_number("nan"));
}

static std::string write_tmp(std::string const &content, bool gz) {
	std::string tmpname = "/tmp/geocsv.XXXXXX";
	int fd = mkstemp((char *) tmpname.c_str());
	REQUIRE(fd >= 0);
	close(fd);

	if (gz) {
		gzFile f = gzopen(tmpname.c_str(), "wb");
		REQUIRE(f != NULL);
		REQUIRE(gzwrite(f, content.c_str(), content.size()) == (int) content.size());
		REQUIRE(gzclose(f) == Z_OK);
	} else {
		FILE *f = fopen(tmpname.c_str(), "wb");
		REQUIRE(f != NULL);
		REQUIRE(fwrite(content.c_str(), 1, content.size(), f) == content.size());
		REQUIRE(fclose(f) == 0);
	}

	return tmpname;
}

TEST_CASE("CSV points", "[geocsv]") {
	std::string csv =
		"id,Name,Latitude,Longitude,pop\n"
		"1,\"Ferry Building\",37.7955,-122.3937,12\n"
		"2,\"Coit Tower, top\",37.8024,-122.4058,\n"
		"3,nowhere,,-122.4,5\n"
		"x4,\"Dolores\nPark\",37.7596,-122.4269,7\n";

	for (bool gz : {false, true}) {
		std::string fname = write_tmp(csv, gz);

		std::vector<member_feature> points;
		parse_geocsv(points, fname);
		unlink(fname.c_str());

		REQUIRE(points.size() == 3);

		REQUIRE(points[0].has_id);
		REQUIRE(points[0].id == 1);
		REQUIRE(points[0].where.lon == -122.3937);
		REQUIRE(points[0].where.lat == 37.7955);
		std::vector<std::string> keys = {"Name", "pop"};
		std::vector<std::string> values = {"Ferry Building", "12"};
		REQUIRE(points[0].keys == keys);
		REQUIRE(points[0].values == values);

		REQUIRE(points[1].values[0] == "Coit Tower, top");
		REQUIRE(points[1].values[1] == "");

		// an id that isn't a number is kept as an attribute
		REQUIRE(!points[2].has_id);
		REQUIRE(points[2].keys[0] == "id");
		REQUIRE(points[2].values[0] == "x4");
		REQUIRE(points[2].values[1] == "Dolores\nPark");
	}
}

TEST_CASE("GeoJSON output", "[json]") {
	REQUIRE(json_quote("a\"b\\c\n\x01") == "\"a\\\"b\\\\c\\n\\u0001\"");

	REQUIRE(point_count_abbreviated(999) == "999");
	REQUIRE(point_count_abbreviated(1234) == "1.2k");
	REQUIRE(point_count_abbreviated(12345) == "12k");

	point_group single(mock_point(-122.39, 37.79, 7));
	REQUIRE(geojson_feature(single) == "{\"type\":\"Feature\",\"id\":7,\"properties\":{\"name\":\"point 7\"},\"geometry\":{\"type\":\"Point\",\"coordinates\":[-122.390000,37.790000]}}");

	point_group other(mock_point(-122.38, 37.79, 8));
	single.merge_in(other);
	REQUIRE(geojson_feature(single) == "{\"type\":\"Feature\",\"properties\":{\"clustered\":true,\"point_count\":2,\"sqrt_point_count\":1.41,\"point_count_abbreviated\":\"2\"},\"geometry\":{\"type\":\"Point\",\"coordinates\":[-122.385000,37.790000]}}");
}

TEST_CASE("Integer arguments", "[text]") {
	REQUIRE(integer_arg("--zoom", "10") == 10);
	REQUIRE(integer_arg("--zoom", "-1") == -1);
	REQUIRE(integer_arg("--cluster-distance", "260") == 260);
}
