#include <stdlib.h>
#include <ctype.h>
#include "csv.hpp"

// Reads one logical line, which may span several physical lines
// if a newline appears within a quoted field. The trailing newline
// is included; an empty string means end of file.
std::string csv_getline(gzFile f) {
	std::string out;
	bool within = false;
	int c;

	while ((c = gzgetc(f)) != -1) {
		out.push_back(c);

		if (c == '"') {
			within = !within;
		} else if (c == '\n' && !within) {
			break;
		}
	}

	return out;
}

std::vector<std::string> csv_split(const char *s) {
	std::vector<std::string> ret;

	while (*s && *s != '\n' && *s != '\r') {
		const char *start = s;
		bool within = false;

		for (; *s; s++) {
			if ((*s == '\n' || *s == '\r') && !within) {
				break;
			}
			if (*s == '"') {
				within = !within;
			}
			if (*s == ',' && !within) {
				break;
			}
		}

		ret.push_back(std::string(start, s - start));

		if (*s == ',') {
			s++;

			if (*s == '\0' || *s == '\r' || *s == '\n') {
				ret.push_back(std::string(""));
				break;
			}
		}
	}

	return ret;
}

std::string csv_dequote(std::string s) {
	std::string out;

	for (size_t i = 0; i < s.size(); i++) {
		if (s[i] == '"') {
			if (i + 1 < s.size() && s[i + 1] == '"') {
				out.push_back('"');
				i++;
			}
		} else {
			out.push_back(s[i]);
		}
	}

	return out;
}

// Whether `s` is written the way a JSON number would be,
// so that it can be passed through to the output unquoted
bool is_number(std::string const &s) {
	const char *cp = s.c_str();

	if (*cp == '-') {
		cp++;
	}
	if (*cp == '0') {
		cp++;
	} else if (isdigit(*cp)) {
		while (isdigit(*cp)) {
			cp++;
		}
	} else {
		return false;
	}

	if (*cp == '.') {
		cp++;
		if (!isdigit(*cp)) {
			return false;
		}
		while (isdigit(*cp)) {
			cp++;
		}
	}

	if (*cp == 'e' || *cp == 'E') {
		cp++;
		if (*cp == '+' || *cp == '-') {
			cp++;
		}
		if (!isdigit(*cp)) {
			return false;
		}
		while (isdigit(*cp)) {
			cp++;
		}
	}

	return *cp == '\0' && (size_t) (cp - s.c_str()) == s.size();
}
