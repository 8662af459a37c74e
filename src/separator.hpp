#ifndef PHRASEGEN_SEPARATOR_HPP
#define PHRASEGEN_SEPARATOR_HPP

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


#include "soname.hpp"
#include <string>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {

class Random_source;


// Characters used by the symbol separators. All of them can be typed on a
// US keyboard without dead keys.
extern EXPORTFN const char separator_symbols[];


// What goes between two adjacent words. Either a fixed string, possibly
// empty, or a token drawn anew for each gap.
struct Separator {
	enum Kind { literal, numeric, symbolic, mixed };

	Kind kind;
	std::string text;   // Only used by literal.

	Separator () : kind(literal), text("-") {}
	Separator (Kind k, const std::string &t = std::string()) : kind(k), text(t) {}
};


// Interpret the command line value. "_n" selects random digits, "_s"
// random symbols and "_b" a random choice between both for each gap.
// Anything else is taken literally after removing a pair of surrounding
// single quotes.
EXPORTFN Separator parse_separator (const std::string &s);

// Return the separator for the next gap. literal returns the fixed text.
// numeric returns one digit, symbolic one character of separator_symbols
// and mixed flips a coin for each call to pick one of the two.
EXPORTFN std::string next_separator (const Separator &sep, Random_source &rng);


}}

#endif
