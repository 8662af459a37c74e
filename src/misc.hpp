#ifndef PHRASEGEN_MISC_HPP
#define PHRASEGEN_MISC_HPP

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




#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <string>
#include <vector>
#include <string.h>
#include "soname.hpp"


// Miscellaneous support functions.


namespace phrasegen {    namespace PHRASEGEN_SONAME  {


// Little endian access to unaligned storage.
inline uint32_t leget32 (const void *vp)
{
	const uint8_t *p = (const uint8_t*)vp;
	return (uint32_t(p[3]) << 24) | (uint32_t(p[2]) << 16) |
	       (uint32_t(p[1]) << 8) | p[0];
}

inline void leput32 (void *dest, uint32_t value)
{
	uint8_t *p = (uint8_t*)dest;
	p[0] = value & 0xFF;
	p[1] = (value >> 8) & 0xFF;
	p[2] = (value >> 16) & 0xFF;
	p[3] = value >> 24;
}


// Out of line version of memset(0). Used to remove key material from the
// stack.
EXPORTFN void crypto_bzero(void *p, size_t n);

// Helper to perform clean up of the stack.
class EXPORTFN Janitor {
	void *p;
	size_t n;
public:
	Janitor(void *pp, size_t nn) : p(pp), n(nn) {}
	~Janitor() { crypto_bzero (p, n); }
};


// Remove leading and trailing white space, as defined by isspace() in the
// "C" locale.
EXPORTFN std::string trim(const std::string &s);


// Write and read a block as a sequence of hex digits.
EXPORTFN
void show_block(std::ostream &os, const char *label, const void *b,
                size_t nbytes, int group=4);

// Read from in and store in dst. Store in *next the pointer to the next non
// hex character in in (may be the terminating null). It skips spaces.
// Returns the number of bytes read or -1 if there is an odd number of hex
// digits.
EXPORTFN
ptrdiff_t read_block(const char *in, const char **next,
                     std::vector<uint8_t> &dst);


}}

#endif
