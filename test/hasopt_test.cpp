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
#include <iostream>
#include <string>
#include <vector>
#include <string.h>

using namespace phrasegen;

static int nerr = 0;

static void check (bool ok, const char *what)
{
	if (!ok) {
		format (std::cout, "error: %s\n", what);
		++nerr;
	}
}

static void check_eq (const std::string &got, const std::string &expected)
{
	if (got != expected) {
		format (std::cout, "error: got '%s', expected '%s'\n", got, expected);
		++nerr;
	}
}


// Mutable copy of a command line.
struct Args {
	std::vector<std::string> store;
	std::vector<char*> ptrs;
	int argc;

	Args (const char *const *a, int n) : store (a, a + n) {
		for (size_t i = 0; i < store.size(); ++i) {
			ptrs.push_back (&store[i][0]);
		}
		ptrs.push_back (NULL);
		argc = n;
	}
	char ** argv() { return &ptrs[0]; }
};


static void test_short ()
{
	const char *cl[] = { "prog", "-tv", "-w", "5", "-s_n", "rest", "-S", "-S" };
	Args a (cl, 8);
	const char *val = NULL;
	std::string seen;
	std::string w, s;
	int op;
	while ((op = hasopt (&a.argc, a.argv(), "tvw:s:S", &val)) > 0) {
		seen += char(op);
		if (op == 'w') w = val;
		if (op == 's') s = val;
	}
	check (op == 0, "all options recognized");
	check_eq (seen, "tvwsSS");
	check_eq (w, "5");
	check_eq (s, "_n");
	check (a.argc == 2, "only the positional argument is left");
	check_eq (a.argv()[1], "rest");

	// A separator that looks like an option is taken as a value.
	const char *cl2[] = { "prog", "-s", "-", "-x" };
	Args b (cl2, 4);
	op = hasopt (&b.argc, b.argv(), "s:", &val);
	check (op == 's', "-s found");
	check_eq (val, "-");
	op = hasopt (&b.argc, b.argv(), "s:", &val);
	check (op == -1, "unknown option reported");
	check_eq (val, "-x");

	const char *cl3[] = { "prog", "-w" };
	Args c (cl3, 2);
	check (hasopt (&c.argc, c.argv(), "w:", &val) == -1, "missing value reported");
}


static void test_long ()
{
	const char *cl[] = { "prog", "--sep=::", "--list-dir", "/tmp", "--list", "e",
	                     "--strength", "--strength", "--verbose" };
	Args a (cl, 9);
	const char *val = NULL;

	check (hasopt_long (&a.argc, a.argv(), "--list", &val), "--list found");
	check_eq (val, "e");
	check (hasopt_long (&a.argc, a.argv(), "--list-dir", &val), "--list-dir found");
	check_eq (val, "/tmp");
	check (hasopt_long (&a.argc, a.argv(), "--sep", &val), "--sep= found");
	check_eq (val, "::");

	int n = 0;
	while (hasopt_long (&a.argc, a.argv(), "--strength")) {
		++n;
	}
	check (n == 2, "repeated flag counted");
	check (hasopt_long (&a.argc, a.argv(), "--verbose"), "--verbose found");
	check (!hasopt_long (&a.argc, a.argv(), "--verbose"), "--verbose removed");
	check (a.argc == 1, "all arguments consumed");

	const char *cl2[] = { "prog", "--words" };
	Args b (cl2, 2);
	bool thrown = false;
	try {
		hasopt_long (&b.argc, b.argv(), "--words", &val);
	} catch (std::runtime_error &) {
		thrown = true;
	}
	check (thrown, "missing value of long option throws");
}


static void test_format ()
{
	check_eq (sformat ("plain"), "plain");
	check_eq (sformat ("100%%"), "100%");
	check_eq (sformat ("%d words", 7), "7 words");
	check_eq (sformat ("%zu of %zu", size_t(3), size_t(8192)), "3 of 8192");
	check_eq (sformat ("%.2f bits", 41.359400011), "41.36 bits");
	check_eq (sformat ("[%5d]", 42), "[   42]");
	check_eq (sformat ("[%-5s]", "ab"), "[ab   ]");
	check_eq (sformat ("[%03d]", 7), "[007]");
	check_eq (sformat ("%x", 255), "ff");
	check_eq (sformat ("%s %d", true, true), "true 1");
	check_eq (sformat ("%s", std::string ("str")), "str");
	check_eq (sformat ("%c", 'q'), "q");
	// Extra specifications are written as they are, extra arguments dropped.
	check_eq (sformat ("%d and %s", 1), "1 and %s");
	check_eq (sformat ("%d", 1, 2), "1");

	// The state of the stream is restored.
	std::ostringstream os;
	format (os, "%.1f", 2.25);
	os << ' ' << 2.25;
	check_eq (os.str(), "2.2 2.25");
}


static void test_describe ()
{
	try {
		try {
			throw_rte ("inner %d", 1);
		} catch (std::exception &) {
			throw_nrte ("outer %s", "two");
		}
	} catch (std::exception &e) {
		check_eq (describe (e), "Reason: outer two\nReason: inner 1\n");
	}
}


void real_main ()
{
	test_short ();
	test_long ();
	test_format ();
	test_describe ();

	if (nerr != 0) {
		throw_rte ("%d hasopt checks failed", nerr);
	}
	format (std::cout, "hasopt tests passed\n");
}

int main ()
{
	return run_main (real_main);
}
