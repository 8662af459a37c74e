#ifndef PHRASEGEN_HASOPT_HPP
#define PHRASEGEN_HASOPT_HPP

/* Copyright (c) 2015-2017, Pelayo Bernedo.
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE
 * GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
 * HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 * LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT
 * OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */


// Command line options, formatted output and error handling.


#include "soname.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {

// Similar to getopt. The opts string is a sequence of single letter
// options. If the option takes an argument it is followed by a colon. The
// function returns the option found and removes it from argv. If the option
// takes an argument *val points to it. Grouped flags like -tv are accepted.
// It returns 0 when there are no more options and -1 if there is an unknown
// option or a missing argument. In that case *val points to the offending
// argument.
EXPORTFN int hasopt (int *argcp, char **argv, const char *opts, const char **val);


// Check if a long flag was passed in the command line and remove it from
// the arguments. The longopt must include the double hyphen. Only the first
// occurrence is removed, so it can be called in a loop to count repetitions.
EXPORTFN bool hasopt_long (int *argcp, char **argv, const char *longopt);


// Check if a long option with a value was passed, either as "--opt value" or
// as "--opt=value", and remove it from the arguments. Throws if the option
// is the last argument and has no value.
EXPORTFN bool hasopt_long (int *argcp, char **argv, const char *longopt,
                           const char **val);


// Return a string which contains the error description, including any nested
// exceptions.
EXPORTFN std::string describe (const std::exception &e);


// Run the real_main. Catch and show any exceptions and return EXIT_FAILURE
// if one was thrown.
EXPORTFN int run_main (void (*real_main)());
EXPORTFN int run_main (int argc, char **argv, int (*real_main)(int,char**));


// Placeholder for internationalization. When the program is adapted for
// gettext the _() strings are already there.
inline const char * _(const char *s) { return s; }


// format (stream,fmt,args...) works like fprintf but writes to a
// std::ostream and is type safe. Each %-specification consumes the next
// argument, which is written with its operator<<. The flags, width,
// precision and conversion letter only set the state of the stream while
// the argument is written:
//
//   -       left align
//   0       pad with zeros
//   N       minimum width
//   .N      precision
//   d i u   decimal; a bool is written as 0 or 1
//   s       a bool is written as true or false
//   f e     fixed or scientific notation
//   x X o   hexadecimal or octal
//
// Size modifiers (h, l, ll, z, j, t) are accepted and ignored. %% writes a
// single %. Specifications without a matching argument are written as they
// are, extra arguments are ignored.

struct Format_spec {
	int width;
	int precision;
	bool left;
	bool zero;
	char conv;
};

// Write the literal text of fmt up to the next specification, parse it into
// *spec and return the text that follows it. Returns NULL if the end of fmt
// was reached without finding a specification.
EXPORTFN const char * next_format_spec (std::ostream &os, const char *fmt,
                                        Format_spec *spec);

// Set the state of os according to spec.
EXPORTFN void apply_format_spec (std::ostream &os, const Format_spec &spec);

EXPORTFN void format (std::ostream &os, const char *fmt);

template <class T, class ... Args>
void format (std::ostream &os, const char *fmt, const T &t, const Args &... args)
{
	Format_spec spec;
	const char *rest = next_format_spec (os, fmt, &spec);
	if (rest == NULL) {
		return;
	}

	std::ios_base::fmtflags saved_flags = os.flags();
	std::streamsize saved_prec = os.precision();
	char saved_fill = os.fill();

	apply_format_spec (os, spec);
	os << t;

	os.flags (saved_flags);
	os.precision (saved_prec);
	os.fill (saved_fill);

	format (os, rest, args...);
}

// Return a string with the proper formatting.
template <class ... Args>
std::string sformat (const char *fmt, const Args &... args)
{
	std::ostringstream os;
	format (os, fmt, args...);
	return os.str();
}


// Throw a std::runtime_error exception with the given information.
template <class ...Args>
void throw_rte (const char *fmt, const Args &... args)
{
	throw std::runtime_error (sformat (fmt, args...));
}

// Throw with nested using the given information. Must be called from within
// a catch block.
template <class ...Args>
void throw_nrte (const char *fmt, const Args &... args)
{
	std::throw_with_nested (std::runtime_error (sformat (fmt, args...)));
}


}}

#endif
