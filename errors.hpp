#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

#define EXIT_ARGS 100	   // bad command line arguments
#define EXIT_OPEN 101	   // can't open input or output file
#define EXIT_READ 102	   // error reading input
#define EXIT_WRITE 103	   // error writing output
#define EXIT_CLOSE 104	   // error closing a file
#define EXIT_UTF8 105	   // input is not valid UTF-8
#define EXIT_CSV 106	   // malformed CSV input
#define EXIT_PTHREAD 107   // mutex failure
#define EXIT_IMPOSSIBLE 199  // internal invariant violated

// Thrown when a requested clustering distance threshold is outside
// the range for which geohash length tables may be cached.
struct threshold_out_of_range : std::out_of_range {
	int threshold;

	threshold_out_of_range(int t, std::string const &what)
	    : std::out_of_range(what),
	      threshold(t) {
	}
};

#endif
