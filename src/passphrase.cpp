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

#include "passphrase.hpp"
#include "wordlist.hpp"
#include "random.hpp"
#include "utf8.hpp"
#include "hasopt.hpp"
#include <stdexcept>


namespace phrasegen {   namespace PHRASEGEN_SONAME {


const std::string & pick_word (const Word_source &words, Random_source &rng)
{
	size_t n = words.size();
	if (n == 0) {
		throw std::invalid_argument (_("Cannot pick a word from an empty list"));
	}
	if (n > 0xFFFFFFFFu) {
		throw std::invalid_argument (_("The word list is too long"));
	}
	return words[uniform_below (rng, uint32_t(n))];
}


std::string generate_passphrase (size_t word_count, const Separator &sep,
                                 bool title, const Word_source &words,
                                 Random_source &rng)
{
	if (word_count == 0) {
		throw std::invalid_argument (_("A passphrase needs at least one word"));
	}

	std::string res;
	for (size_t i = 0; i < word_count; ++i) {
		if (i > 0) {
			res += next_separator (sep, rng);
		}
		const std::string &w = pick_word (words, rng);
		if (title) {
			res += title_case (w);
		} else {
			res += w;
		}
	}
	return res;
}


}}
