#ifndef PHRASEGEN_UTF8_HPP
#define PHRASEGEN_UTF8_HPP

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
#include <stdint.h>
#include <stddef.h>
#include <string>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {

// Decode the code point that starts at s[pos]. Store it in *cp and return
// the number of bytes used, or 0 if the sequence is not valid UTF-8.
EXPORTFN size_t utf8_decode (const std::string &s, size_t pos, uint32_t *cp);

// Append the UTF-8 encoding of cp to s.
EXPORTFN void utf8_append (std::string &s, uint32_t cp);

// Title case form of a single code point. Letters without a case are
// returned unchanged. ASCII, Latin-1 and Latin Extended-A are converted
// directly; other letters need a UTF-8 locale to be installed.
EXPORTFN uint32_t to_titlecase (uint32_t cp);

// Return the word with its first code point in title case. The rest of the
// word, and words that do not start with valid UTF-8, are left as they are.
EXPORTFN std::string title_case (const std::string &word);

}}

#endif
