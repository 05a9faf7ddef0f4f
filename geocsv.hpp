#ifndef GEOCSV_HPP
#define GEOCSV_HPP

#include <string>
#include <vector>
#include "point-group.hpp"

void parse_geocsv(std::vector<member_feature> &out, std::string fname);

#endif
