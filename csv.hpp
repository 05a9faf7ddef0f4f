#ifndef CSV_HPP
#define CSV_HPP

#include <string>
#include <vector>
#include <zlib.h>

std::string csv_getline(gzFile f);
std::vector<std::string> csv_split(const char *s);
std::string csv_dequote(std::string s);
bool is_number(std::string const &s);

#endif
