#ifndef PHRASEGEN_PASSPHRASE_HPP
#define PHRASEGEN_PASSPHRASE_HPP

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


// Assembly of passphrases from random words.


#include "soname.hpp"
#include "separator.hpp"
#include <stddef.h>
#include <string>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {

class Random_source;
class Word_source;


// Pick one word of the list with uniform probability.
EXPORTFN const std::string & pick_word (const Word_source &words, Random_source &rng);


// Draw word_count words, title case them if title is true and join them
// with the separator. Each gap gets its own call to next_separator(), so
// random separators differ between gaps. The words are drawn independently,
// a word may appear more than once.

// Throws std::invalid_argument if word_count is zero, if the list is empty
// or if it has more than 2³² words.
EXPORTFN std::string generate_passphrase (size_t word_count, const Separator &sep,
                                          bool title, const Word_source &words,
                                          Random_source &rng);


}}

#endif
