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

// Timing of the passphrase generation. Not part of the regular tests.


#include "passphrase.hpp"
#include "wordlist.hpp"
#include "random.hpp"
#include "hasopt.hpp"
#include <iostream>
#include <chrono>
#include <vector>

using namespace phrasegen;

typedef std::chrono::duration<double, std::nano> Fns;
typedef std::chrono::high_resolution_clock Clock;


// Same size as the default list.
static Word_vector synthetic_list ()
{
	std::vector<std::string> v;
	for (int i = 0; i < 8192; ++i) {
		v.push_back (sformat ("word%04d", i));
	}
	return Word_vector (v);
}


void real_main ()
{
	const int rounds = 100000;
	Word_vector words = synthetic_list ();
	Chacha_random rng;
	size_t total = 0;

	Clock::time_point t1 = Clock::now();
	for (int i = 0; i < rounds; ++i) {
		total += generate_passphrase (7, Separator(), false, words, rng).size();
	}
	Clock::time_point t2 = Clock::now();
	format (std::cout, _("7 words, literal separator:  %.0f ns per passphrase\n"),
	        std::chrono::duration_cast<Fns>(t2 - t1).count() / rounds);

	Separator mixed (Separator::mixed);
	t1 = Clock::now();
	for (int i = 0; i < rounds; ++i) {
		total += generate_passphrase (7, mixed, true, words, rng).size();
	}
	t2 = Clock::now();
	format (std::cout, _("7 words, mixed, title case:  %.0f ns per passphrase\n"),
	        std::chrono::duration_cast<Fns>(t2 - t1).count() / rounds);

	uint32_t acc = 0;
	t1 = Clock::now();
	for (int i = 0; i < rounds; ++i) {
		acc += uniform_below (rng, 7776);
	}
	t2 = Clock::now();
	format (std::cout, _("uniform_below(7776):         %.1f ns per draw\n"),
	        std::chrono::duration_cast<Fns>(t2 - t1).count() / rounds);

	t1 = Clock::now();
	for (int i = 0; i < 1000; ++i) {
		Chacha_random seeded;
		acc += seeded.get32();
	}
	t2 = Clock::now();
	format (std::cout, _("seeding from the system:     %.0f ns\n"),
	        std::chrono::duration_cast<Fns>(t2 - t1).count() / 1000);

	// Keep the results alive.
	format (std::cout, "(%zu %u)\n", total, acc);
}

int main ()
{
	return run_main (real_main);
}
