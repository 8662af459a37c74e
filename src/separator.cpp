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
#include <string.h>


namespace phrasegen {   namespace PHRASEGEN_SONAME {


const char separator_symbols[] = "!#$%&()*+,-./:;<=>?@[]^_{|}~";


Separator parse_separator (const std::string &s)
{
	if (s == "_n") return Separator (Separator::numeric);
	if (s == "_s") return Separator (Separator::symbolic);
	if (s == "_b") return Separator (Separator::mixed);

	if (s.size() >= 2 && s[0] == '\'' && s[s.size() - 1] == '\'') {
		return Separator (Separator::literal, s.substr (1, s.size() - 2));
	}
	return Separator (Separator::literal, s);
}


static std::string random_digit (Random_source &rng)
{
	return std::string (1, char('0' + uniform_below (rng, 10)));
}

static std::string random_symbol (Random_source &rng)
{
	uint32_t nsym = strlen (separator_symbols);
	return std::string (1, separator_symbols[uniform_below (rng, nsym)]);
}


std::string next_separator (const Separator &sep, Random_source &rng)
{
	switch (sep.kind) {
	case Separator::numeric:
		return random_digit (rng);
	case Separator::symbolic:
		return random_symbol (rng);
	case Separator::mixed:
		if (uniform_below (rng, 2) == 0) {
			return random_digit (rng);
		}
		return random_symbol (rng);
	case Separator::literal:
		break;
	}
	return sep.text;
}


}}
