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
#include <math.h>
#include <stdexcept>


namespace phrasegen {   namespace PHRASEGEN_SONAME {


size_t required_entropy (const Request &r)
{
	switch (r.kind) {
	case Request::minimum_entropy:
		return r.value;
	case Request::strength_steps:
		if (r.value > (size_t(-1) - default_minimum_entropy) / strength_step_bits) {
			throw std::invalid_argument (sformat (_("%zu strength steps are too many"), r.value));
		}
		return default_minimum_entropy + r.value * strength_step_bits;
	case Request::exact_words:
		break;
	}
	throw std::invalid_argument (_("An exact word count does not require any entropy"));
}


Request secure_request (const Request &r)
{
	size_t bits = required_entropy (r);
	return Request::entropy (bits > secure_minimum_entropy ? bits : secure_minimum_entropy);
}


size_t words_for_entropy (size_t bits, size_t list_length)
{
	if (list_length < 2) {
		throw_rte (_("The word list has %zu distinct words. At least 2 are needed "
		             "to provide any entropy."), list_length);
	}
	double per_word = log2 (double(list_length));
	double words = ceil (double(bits) / per_word);
	if (words > maximum_words) {
		throw_rte (_("%zu bits of entropy need more than %d words from a list of %zu words"),
		           bits, int(maximum_words), list_length);
	}
	size_t n = size_t (words);

	// Guard against rounding in the division. Never deliver less than the
	// requested entropy.
	while (n * per_word < double(bits)) {
		++n;
	}
	while (n > 1 && (n - 1) * per_word >= double(bits)) {
		--n;
	}
	return n == 0 ? 1 : n;
}


size_t resolve_word_count (const Request &r, size_t list_length)
{
	if (r.kind == Request::exact_words) {
		if (r.value == 0) {
			throw std::invalid_argument (_("A passphrase needs at least one word"));
		}
		if (r.value > maximum_words) {
			throw std::invalid_argument (sformat (_("A passphrase cannot have more than %d words"),
			                                      int(maximum_words)));
		}
		return r.value;
	}
	return words_for_entropy (required_entropy (r), list_length);
}


double estimate_bits (size_t word_count, size_t list_length)
{
	if (list_length < 2) {
		return 0;
	}
	return log2 (double(list_length)) * word_count;
}


}}
