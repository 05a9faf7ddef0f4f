#ifndef WRITE_JSON_HPP
#define WRITE_JSON_HPP

#include <stdio.h>
#include <string>
#include <vector>
#include "point-group.hpp"

std::string json_quote(std::string const &s);
std::string point_count_abbreviated(long long point_count);
std::string geojson_feature(point_group const &g);
void write_geojson(FILE *fp, std::vector<point_group> const &groups, const char *fname);

#endif
