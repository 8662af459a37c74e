#ifndef PHRASEGEN_ENTROPY_HPP
#define PHRASEGEN_ENTROPY_HPP

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


// Conversion between word counts and bits of entropy.


#include "soname.hpp"
#include <stddef.h>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {

enum {
	default_minimum_entropy = 80,   // Bits required if nothing is requested.
	strength_step_bits = 20,        // Bits added by each strength step.
	secure_minimum_entropy = 105,   // Floor applied by the secure mode.
	maximum_words = 1000            // Longest passphrase that will be built.
};


// What the user asked for. Exactly one of the three forms is active.
struct Request {
	enum Kind { exact_words, minimum_entropy, strength_steps };

	Kind kind;
	size_t value;

	static Request words (size_t n)        { Request r = { exact_words, n }; return r; }
	static Request entropy (size_t bits)   { Request r = { minimum_entropy, bits }; return r; }
	static Request strength (size_t steps) { Request r = { strength_steps, steps }; return r; }
	static Request defaults ()             { return entropy (default_minimum_entropy); }
};


// Number of bits that the request demands. Only valid for requests that
// are not exact_words. Throws std::invalid_argument if the strength steps
// do not fit in a size_t.
EXPORTFN size_t required_entropy (const Request &r);

// Return the request raised to at least secure_minimum_entropy bits. Throws
// std::invalid_argument for exact_words requests, which leave no room for a
// floor.
EXPORTFN Request secure_request (const Request &r);

// Smallest n such that n * log2(list_length) >= bits. The result is at
// least one. Throws std::runtime_error if list_length < 2, because then no
// number of words provides any entropy, or if more than maximum_words would
// be needed.
EXPORTFN size_t words_for_entropy (size_t bits, size_t list_length);

// The number of words to generate for the request. exact_words is returned
// as is, without looking at the list. Throws std::invalid_argument if the
// request asks for zero words or for more than maximum_words.
EXPORTFN size_t resolve_word_count (const Request &r, size_t list_length);

// log2(list_length) * word_count. Only used to inform the user. Randomized
// separators are not counted.
EXPORTFN double estimate_bits (size_t word_count, size_t list_length);


}}

#endif
