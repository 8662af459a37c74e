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

#include "entropy.hpp"
#include "hasopt.hpp"
#include <iostream>
#include <stdexcept>
#include <math.h>

using namespace phrasegen;

static int nerr = 0;

static void check (bool ok, const char *what)
{
	if (!ok) {
		format (std::cout, "error: %s\n", what);
		++nerr;
	}
}


static const size_t list_lengths[] = { 2, 3, 7, 1024, 1296, 1633, 7776, 8192, 17576 };


static void test_examples ()
{
	check (resolve_word_count (Request::entropy (80), 8192) == 7, "80 bits from 8192 words");
	check (resolve_word_count (Request::defaults(), 8192) == 7, "default request from 8192 words");
	check (resolve_word_count (Request::entropy (80), 7776) == 7, "80 bits from 7776 words");
	check (resolve_word_count (Request::entropy (80), 1296) == 8, "80 bits from 1296 words");
	// 80 bits are exactly 8 words of 10 bits. No extra word is added.
	check (resolve_word_count (Request::entropy (80), 1024) == 8, "80 bits from 1024 words");
	check (resolve_word_count (Request::entropy (81), 1024) == 9, "81 bits from 1024 words");
	// One bit per word.
	check (resolve_word_count (Request::entropy (80), 2) == 80, "80 bits from 2 words");
	check (fabs (estimate_bits (80, 2) - 80.0) < 1e-9, "estimate for 80 words of 2");

	check (resolve_word_count (Request::words (4), 1296) == 4, "exact count of 4");
	double bits = estimate_bits (4, 1296);
	check (fabs (bits - 4 * log2 (1296.0)) < 1e-9, "estimate for 4 words of 1296");
	check (fabs (bits - 41.36) < 0.01, "4 words of 1296 are 41.36 bits");

	check (fabs (estimate_bits (7, 8192) - 91.0) < 1e-9, "estimate for 7 words of 8192");
	check (estimate_bits (3, 1) == 0, "a single word list has no entropy");
}


static void test_minimality ()
{
	for (size_t li = 0; li < sizeof list_lengths / sizeof list_lengths[0]; ++li) {
		size_t len = list_lengths[li];
		double per_word = log2 (double(len));
		for (size_t e = 1; e <= 300; ++e) {
			size_t n = resolve_word_count (Request::entropy (e), len);
			if (n < 1 || n * per_word < e || (n - 1) * per_word >= e) {
				format (std::cout, "wrong count %zu for %zu bits and %zu words\n", n, e, len);
				++nerr;
			}
		}
	}
}


static void test_request_forms ()
{
	for (size_t k = 1; k < 50; ++k) {
		check (resolve_word_count (Request::words (k), 8192) == k, "exact count is kept");
		// No entropy check for explicit counts, even with useless lists.
		check (resolve_word_count (Request::words (k), 1) == k, "exact count with one word");
		check (resolve_word_count (Request::words (k), 0) == k, "exact count with no words");
	}

	for (size_t k = 0; k < 10; ++k) {
		check (required_entropy (Request::strength (k)) == 80 + 20 * k, "bits of strength steps");
		for (size_t li = 0; li < sizeof list_lengths / sizeof list_lengths[0]; ++li) {
			size_t len = list_lengths[li];
			check (resolve_word_count (Request::strength (k), len) ==
			       resolve_word_count (Request::entropy (80 + 20 * k), len),
			       "strength steps resolve like the same entropy");
		}
	}
	check (resolve_word_count (Request::strength (1), 8192) == 8, "one strength step from 8192 words");
}


static void test_secure ()
{
	check (required_entropy (secure_request (Request::defaults())) == 105,
	       "secure raises the default to 105");
	check (required_entropy (secure_request (Request::entropy (50))) == 105,
	       "secure raises 50 bits to 105");
	check (required_entropy (secure_request (Request::entropy (150))) == 150,
	       "secure keeps 150 bits");
	check (required_entropy (secure_request (Request::strength (2))) == 120,
	       "secure keeps two strength steps");
	check (resolve_word_count (secure_request (Request::defaults()), 8192) == 9,
	       "secure default from 8192 words");

	bool thrown = false;
	try {
		secure_request (Request::words (5));
	} catch (std::invalid_argument &) {
		thrown = true;
	}
	check (thrown, "secure with an exact count throws");
}


static void test_errors ()
{
	bool thrown = false;
	try {
		resolve_word_count (Request::entropy (80), 1);
	} catch (std::runtime_error &) {
		thrown = true;
	}
	check (thrown, "a list of one word throws");

	thrown = false;
	try {
		words_for_entropy (80, 0);
	} catch (std::runtime_error &) {
		thrown = true;
	}
	check (thrown, "an empty list throws");

	thrown = false;
	try {
		resolve_word_count (Request::words (0), 8192);
	} catch (std::invalid_argument &) {
		thrown = true;
	}
	check (thrown, "zero words throws");

	// Zero bits still give one word.
	check (resolve_word_count (Request::entropy (0), 8192) == 1, "zero bits give one word");
}


static void test_limits ()
{
	// So many steps that the bit count would wrap around.
	size_t steps = size_t(-1) / strength_step_bits;
	bool thrown = false;
	try {
		required_entropy (Request::strength (steps));
	} catch (std::invalid_argument &) {
		thrown = true;
	}
	check (thrown, "overflowing strength steps throw");

	thrown = false;
	try {
		resolve_word_count (Request::strength (steps), 8192);
	} catch (std::invalid_argument &) {
		thrown = true;
	}
	check (thrown, "overflowing strength steps are not resolved");

	check (resolve_word_count (Request::words (maximum_words), 8192) == maximum_words,
	       "the longest passphrase is accepted");
	thrown = false;
	try {
		resolve_word_count (Request::words (maximum_words + 1), 8192);
	} catch (std::invalid_argument &) {
		thrown = true;
	}
	check (thrown, "too many exact words throw");

	// One bit per word: exactly the limit, then one more.
	check (resolve_word_count (Request::entropy (maximum_words), 2) == maximum_words,
	       "entropy at the word limit");
	thrown = false;
	try {
		resolve_word_count (Request::entropy (maximum_words + 1), 2);
	} catch (std::runtime_error &) {
		thrown = true;
	}
	check (thrown, "entropy beyond the word limit throws");

	thrown = false;
	try {
		resolve_word_count (Request::entropy (size_t(-1)), 8192);
	} catch (std::runtime_error &) {
		thrown = true;
	}
	check (thrown, "the largest entropy request throws");
}


void real_main ()
{
	test_examples ();
	test_minimality ();
	test_request_forms ();
	test_secure ();
	test_errors ();
	test_limits ();

	if (nerr != 0) {
		throw_rte ("%d entropy checks failed", nerr);
	}
	format (std::cout, "entropy tests passed\n");
}

int main ()
{
	return run_main (real_main);
}
