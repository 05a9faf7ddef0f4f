#ifndef TEXT_HPP
#define TEXT_HPP

#include <string>

std::string check_utf8(std::string text);
int integer_arg(std::string where, std::string text);

#endif
