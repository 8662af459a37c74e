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



#include "hasopt.hpp"
#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#include <exception>
#include <iostream>



namespace phrasegen {   namespace PHRASEGEN_SONAME {

static
void remove_args(int *argcp, char **argv, int i, int count)
{
	for (int j = i + count; j < *argcp; ++j) {
		argv[j - count] = argv[j];
	}
	*argcp -= count;
	argv[*argcp] = NULL;
}


int hasopt(int *argcp, char **argv, const char *opts, const char **val)
{
	for (int i = 1; i < *argcp; ++i) {
		char *arg = argv[i];
		// Not an option, a lone "-" or a long option.
		if (arg[0] != '-' || arg[1] == 0 || arg[1] == '-') continue;

		const char *op = strchr(opts, arg[1]);
		if (arg[1] == ':' || op == NULL) {
			*val = arg;
			return -1;
		}
		int res = arg[1];

		if (op[1] == ':') {
			if (arg[2] != 0) {
				// -sVALUE
				*val = arg + 2;
				remove_args(argcp, argv, i, 1);
			} else if (i + 1 < *argcp) {
				*val = argv[i + 1];
				remove_args(argcp, argv, i, 2);
			} else {
				*val = arg;
				return -1;
			}
			return res;
		}

		// Remove the letter from a group like -tv.
		memmove(arg + 1, arg + 2, strlen(arg + 2) + 1);
		if (arg[1] == 0) {
			remove_args(argcp, argv, i, 1);
		}
		return res;
	}
	return 0;
}


bool hasopt_long(int *argcp, char **argv, const char *longopt)
{
	for (int i = 1; i < *argcp; ++i) {
		if (strcmp(argv[i], longopt) == 0) {
			remove_args(argcp, argv, i, 1);
			return true;
		}
	}
	return false;
}


bool hasopt_long(int *argcp, char **argv, const char *longopt,
                 const char **val)
{
	size_t olen = strlen(longopt);

	for (int i = 1; i < *argcp; ++i) {
		if (strncmp(argv[i], longopt, olen) != 0) continue;

		if (argv[i][olen] == '=') {
			*val = argv[i] + olen + 1;
			remove_args(argcp, argv, i, 1);
			return true;
		}
		if (argv[i][olen] == 0) {
			if (i + 1 >= *argcp) {
				throw_rte(_("The option %s requires a value."), longopt);
			}
			*val = argv[i + 1];
			remove_args(argcp, argv, i, 2);
			return true;
		}
	}
	return false;
}



std::string describe(const std::exception &e)
{
	std::string res = sformat(_("Reason: %s\n"), e.what());

	try {
		std::rethrow_if_nested(e);
	} catch (std::exception &ne) {
		res += describe(ne);
	} catch (...) {
		res += _("Unknown exception class\n");
	}
	return res;
}


static void show_exception(const std::exception &e)
{
	std::cerr << _("The program was interrupted\n");
	std::cerr << describe(e);
}


int run_main(void (*real_main)())
{
	try {
		real_main();
		return EXIT_SUCCESS;
	} catch (std::exception &e) {
		show_exception(e);
	} catch (...) {
		std::cerr << _("Some unknown exception was caught.\n");
	}
	return EXIT_FAILURE;
}


int run_main(int argc, char **argv, int (*real_main)(int,char**))
{
	try {
		return real_main(argc, argv);
	} catch (std::exception &e) {
		show_exception(e);
	} catch (...) {
		std::cerr << _("Some unknown exception was caught.\n");
	}
	return EXIT_FAILURE;
}



const char * next_format_spec(std::ostream &os, const char *fmt,
                              Format_spec *spec)
{
	for (;;) {
		const char *pct = strchr(fmt, '%');
		if (pct == NULL) {
			os << fmt;
			return NULL;
		}
		os.write(fmt, pct - fmt);
		if (pct[1] == '%') {
			os << '%';
			fmt = pct + 2;
			continue;
		}
		fmt = pct + 1;
		break;
	}

	spec->width = -1;
	spec->precision = -1;
	spec->left = false;
	spec->zero = false;

	for (;; ++fmt) {
		if (*fmt == '-') {
			spec->left = true;
		} else if (*fmt == '0') {
			spec->zero = true;
		} else if (*fmt != '+' && *fmt != '#' && *fmt != ' ') {
			break;
		}
	}

	if (isdigit((unsigned char)*fmt)) {
		spec->width = 0;
		while (isdigit((unsigned char)*fmt)) {
			spec->width = spec->width * 10 + (*fmt++ - '0');
		}
	}
	if (*fmt == '.') {
		++fmt;
		spec->precision = 0;
		while (isdigit((unsigned char)*fmt)) {
			spec->precision = spec->precision * 10 + (*fmt++ - '0');
		}
	}

	// Size modifiers carry no information for a stream.
	while (*fmt && strchr("hlLzjt", *fmt)) {
		++fmt;
	}

	spec->conv = *fmt;
	if (*fmt) {
		++fmt;
	}
	return fmt;
}


void apply_format_spec(std::ostream &os, const Format_spec &spec)
{
	std::ios_base::fmtflags how = os.flags() &
		~(std::ios_base::adjustfield | std::ios_base::basefield |
		  std::ios_base::floatfield | std::ios_base::uppercase |
		  std::ios_base::boolalpha);

	how |= spec.left ? std::ios_base::left : std::ios_base::right;

	switch (spec.conv) {
	case 'x':
		how |= std::ios_base::hex;
		break;
	case 'X':
		how |= std::ios_base::hex | std::ios_base::uppercase;
		break;
	case 'o':
		how |= std::ios_base::oct;
		break;
	case 'f':
	case 'F':
		how |= std::ios_base::fixed;
		break;
	case 'e':
		how |= std::ios_base::scientific;
		break;
	case 'E':
		how |= std::ios_base::scientific | std::ios_base::uppercase;
		break;
	case 's':
		how |= std::ios_base::dec | std::ios_base::boolalpha;
		break;
	default:
		how |= std::ios_base::dec;
	}
	os.flags(how);

	os.fill(spec.zero && !spec.left ? '0' : ' ');
	if (spec.width >= 0) {
		os.width(spec.width);
	}
	if (spec.precision >= 0) {
		os.precision(spec.precision);
	}
}


void format(std::ostream &os, const char *fmt)
{
	Format_spec spec;
	const char *start = fmt;
	const char *rest;
	// Nothing left to insert. Unmatched specifications are written verbatim.
	while ((rest = next_format_spec(os, start, &spec)) != NULL) {
		const char *pct = rest;
		do {
			--pct;
		} while (*pct != '%');
		os.write(pct, rest - pct);
		start = rest;
	}
}


}}
