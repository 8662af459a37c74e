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

#include "separator.hpp"
#include "random.hpp"
#include "hasopt.hpp"
#include <iostream>
#include <string.h>
#include <ctype.h>

using namespace phrasegen;

static int nerr = 0;

static void check (bool ok, const char *what)
{
	if (!ok) {
		format (std::cout, "error: %s\n", what);
		++nerr;
	}
}


static void test_parse ()
{
	Separator s = parse_separator ("_n");
	check (s.kind == Separator::numeric, "_n is numeric");
	s = parse_separator ("_s");
	check (s.kind == Separator::symbolic, "_s is symbolic");
	s = parse_separator ("_b");
	check (s.kind == Separator::mixed, "_b is mixed");

	s = parse_separator ("-");
	check (s.kind == Separator::literal && s.text == "-", "- is literal");
	s = parse_separator ("");
	check (s.kind == Separator::literal && s.text.empty(), "empty literal");
	s = parse_separator ("' '");
	check (s.kind == Separator::literal && s.text == " ", "quotes are removed");
	s = parse_separator ("''");
	check (s.kind == Separator::literal && s.text.empty(), "quoted empty separator");
	s = parse_separator ("'");
	check (s.kind == Separator::literal && s.text == "'", "single quote is literal");
	s = parse_separator ("_x");
	check (s.kind == Separator::literal && s.text == "_x", "_x is literal");

	Separator def;
	check (def.kind == Separator::literal && def.text == "-", "default separator is -");
}


static void test_literal (Random_source &rng)
{
	Separator s (Separator::literal, "::");
	for (int i = 0; i < 100; ++i) {
		if (next_separator (s, rng) != "::") {
			check (false, "literal separator changed");
			return;
		}
	}
	Separator e (Separator::literal, "");
	check (next_separator (e, rng).empty(), "empty literal stays empty");
}


static bool is_symbol (const std::string &t)
{
	return t.size() == 1 && strchr (separator_symbols, t[0]) != NULL && t[0] != 0;
}


static void test_random_modes (Random_source &rng)
{
	const int ngaps = 2000;
	Separator num (Separator::numeric);
	int digit_seen[10] = { 0 };
	for (int i = 0; i < ngaps; ++i) {
		std::string t = next_separator (num, rng);
		if (t.size() != 1 || !isdigit ((unsigned char)t[0])) {
			check (false, "numeric separator is not a single digit");
			return;
		}
		digit_seen[t[0] - '0']++;
	}
	for (int d = 0; d < 10; ++d) {
		check (digit_seen[d] > 0, "every digit appears in numeric mode");
	}

	Separator sym (Separator::symbolic);
	for (int i = 0; i < ngaps; ++i) {
		if (!is_symbol (next_separator (sym, rng))) {
			check (false, "symbolic separator outside of the symbol set");
			return;
		}
	}

	Separator mix (Separator::mixed);
	int ndigits = 0, nsymbols = 0;
	for (int i = 0; i < ngaps; ++i) {
		std::string t = next_separator (mix, rng);
		if (t.size() == 1 && isdigit ((unsigned char)t[0])) {
			++ndigits;
		} else if (is_symbol (t)) {
			++nsymbols;
		} else {
			check (false, "mixed separator is neither digit nor symbol");
			return;
		}
	}
	check (ndigits > 0 && nsymbols > 0, "mixed mode gives digits and symbols");
	// A fair coin. 2000 flips are well within 800..1200.
	check (ndigits > 800 && ndigits < 1200, "mixed mode flips a fair coin");
}


static void test_symbol_set ()
{
	size_t n = strlen (separator_symbols);
	check (n > 0, "symbol set is not empty");
	for (size_t i = 0; i < n; ++i) {
		char c = separator_symbols[i];
		check (ispunct ((unsigned char)c) != 0, "symbols are punctuation");
		check (strchr (separator_symbols + i + 1, c) == NULL, "symbols are distinct");
	}
}


void real_main ()
{
	uint8_t seed[32] = { 42 };
	Chacha_random rng (seed);

	test_parse ();
	test_literal (rng);
	test_random_modes (rng);
	test_symbol_set ();

	if (nerr != 0) {
		throw_rte ("%d separator checks failed", nerr);
	}
	format (std::cout, "separator tests passed\n");
}

int main ()
{
	return run_main (real_main);
}
