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

#include "utf8.hpp"
#include <locale>
#include <stdexcept>


namespace phrasegen {   namespace PHRASEGEN_SONAME {


size_t utf8_decode (const std::string &s, size_t pos, uint32_t *cp)
{
	if (pos >= s.size()) return 0;

	unsigned char c = s[pos];
	size_t len;
	uint32_t v, min;
	if (c < 0x80) {
		*cp = c;
		return 1;
	} else if ((c & 0xE0) == 0xC0) {
		len = 2;  v = c & 0x1F;  min = 0x80;
	} else if ((c & 0xF0) == 0xE0) {
		len = 3;  v = c & 0x0F;  min = 0x800;
	} else if ((c & 0xF8) == 0xF0) {
		len = 4;  v = c & 0x07;  min = 0x10000;
	} else {
		return 0;
	}
	if (pos + len > s.size()) return 0;

	for (size_t i = 1; i < len; ++i) {
		unsigned char cc = s[pos + i];
		if ((cc & 0xC0) != 0x80) return 0;
		v = (v << 6) | (cc & 0x3F);
	}
	// Overlong forms, surrogates and values beyond Unicode.
	if (v < min || (v >= 0xD800 && v <= 0xDFFF) || v > 0x10FFFF) {
		return 0;
	}
	*cp = v;
	return len;
}


void utf8_append (std::string &s, uint32_t cp)
{
	if (cp < 0x80) {
		s += char(cp);
	} else if (cp < 0x800) {
		s += char(0xC0 | (cp >> 6));
		s += char(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		s += char(0xE0 | (cp >> 12));
		s += char(0x80 | ((cp >> 6) & 0x3F));
		s += char(0x80 | (cp & 0x3F));
	} else {
		s += char(0xF0 | (cp >> 18));
		s += char(0x80 | ((cp >> 12) & 0x3F));
		s += char(0x80 | ((cp >> 6) & 0x3F));
		s += char(0x80 | (cp & 0x3F));
	}
}


// The locale used to upper case letters outside of ASCII.
static std::locale find_wide_locale ()
{
	static const char *names[] = { "C.UTF-8", "C.utf8", "en_US.UTF-8" };
	for (size_t i = 0; i < sizeof names / sizeof names[0]; ++i) {
		try {
			return std::locale (names[i]);
		} catch (std::runtime_error &) {
			// Not installed. Try the next one.
		}
	}
	return std::locale::classic();
}

static const std::locale & wide_locale ()
{
	static const std::locale loc = find_wide_locale();
	return loc;
}


uint32_t to_titlecase (uint32_t cp)
{
	if (cp >= 'a' && cp <= 'z') {
		return cp - 'a' + 'A';
	}
	if (cp < 0x80) {
		return cp;
	}

	// Latin-1 letters. ß has no single upper case letter and stays as is.
	if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
	if (cp == 0xFF) return 0x0178;
	if (cp == 0xB5) return 0x039C;                     // micro sign

	// Latin Extended-A comes in upper/lower pairs.
	if (cp == 0x0131) return 'I';                      // dotless i
	if (cp == 0x017F) return 'S';                      // long s
	if ((cp >= 0x0100 && cp <= 0x0137) || (cp >= 0x014A && cp <= 0x0177)) {
		return cp & ~uint32_t(1);
	}
	if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
		return (cp & 1) ? cp : cp - 1;
	}
	if (cp <= 0x017F) return cp;

	// Latin digraphs have a title case form distinct from the upper case.
	if (cp >= 0x01C4 && cp <= 0x01C6) return 0x01C5;   // Dž
	if (cp >= 0x01C7 && cp <= 0x01C9) return 0x01C8;   // Lj
	if (cp >= 0x01CA && cp <= 0x01CC) return 0x01CB;   // Nj
	if (cp >= 0x01F1 && cp <= 0x01F3) return 0x01F2;   // Dz

	// Everything else is left to the locale.
	if (sizeof(wchar_t) < 4 && cp > 0xFFFF) {
		return cp;
	}
	const std::ctype<wchar_t> &ct = std::use_facet<std::ctype<wchar_t> > (wide_locale());
	wchar_t up = ct.toupper (wchar_t(cp));
	return uint32_t(up);
}


std::string title_case (const std::string &word)
{
	uint32_t cp;
	size_t len = utf8_decode (word, 0, &cp);
	if (len == 0) {
		return word;
	}
	std::string res;
	utf8_append (res, to_titlecase (cp));
	res.append (word, len, std::string::npos);
	return res;
}


}}
