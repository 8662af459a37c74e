#ifndef PHRASEGEN_INFLATE_HPP
#define PHRASEGEN_INFLATE_HPP

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
#include <stddef.h>

namespace phrasegen {  namespace PHRASEGEN_SONAME {


// Wrapper around the zlib inflater for a single stream. Pass chunks of
// compressed input to expand(); the expanded bytes are appended to *res.
// Both gzip and zlib streams are accepted; the header is detected
// automatically.

// If there are errors expand() returns a zlib error code. Later calls
// return the same code without consuming any input.

class EXPORTFN Inflater {
	struct Data;
	Data *pimpl;

	Inflater (const Inflater &);
	Inflater & operator= (const Inflater &);

public:
	Inflater();
	~Inflater();

	// Returns 0 on success or one of the Z_... error codes.
	int expand (const char *buf, size_t n, std::string *res);

	// True once the end of the compressed stream has been seen.
	bool finished() const;
	// Description of the last error or an empty string.
	std::string error_message() const;
};


// Check for the gzip magic number 1f 8b.
inline bool is_gzip (const std::string &data)
{
	return data.size() >= 2 && (unsigned char)data[0] == 0x1f &&
	       (unsigned char)data[1] == 0x8b;
}

// Expand a complete gzip or zlib stream. Throws std::runtime_error if the
// data is corrupt or truncated.
EXPORTFN std::string inflate_all (const std::string &data);


}}

#endif
