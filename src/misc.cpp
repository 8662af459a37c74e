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



#include "misc.hpp"
#include <iostream>
#include <iomanip>
#include <ctype.h>


namespace phrasegen {    namespace PHRASEGEN_SONAME  {


void crypto_bzero(void *p, size_t n)
{
	volatile char *pc = (volatile char*)p;
	while (n > 0) {
		*pc++ = 0;
		--n;
	}
}


std::string trim(const std::string &s)
{
	size_t first = 0, last = s.size();
	while (first < last && isspace((unsigned char)s[first])) ++first;
	while (last > first && isspace((unsigned char)s[last - 1])) --last;
	return s.substr(first, last - first);
}


void show_block(std::ostream &os, const char *label, const void *vb, size_t nbytes, int group)
{
	const uint8_t *b = (const uint8_t*)vb;
	std::ios_base::fmtflags saved = os.flags();
	os << label << ": ";
	os << std::hex << std::uppercase << std::setfill ('0') << std::noshowbase;
	for (size_t i = 0; i < nbytes; ++i) {
		os << std::setw(2) << unsigned(b[i]);
		if (int(i) % group == group - 1) os << ' ';
	}
	os.flags(saved);
	os << std::setfill (' ') << '\n';
}


static int hexval(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}


ptrdiff_t read_block(const char *in, const char **next, std::vector<uint8_t> &dst)
{
	dst.clear();
	for (;;) {
		while (isspace((unsigned char)*in)) ++in;
		int hi = hexval(*in);
		if (hi == -1) {
			*next = in;
			return dst.size();
		}
		++in;
		while (isspace((unsigned char)*in)) ++in;
		int lo = hexval(*in);
		if (lo == -1) {
			*next = in;
			return -1;
		}
		++in;
		dst.push_back(uint8_t(hi << 4 | lo));
	}
}


}}
