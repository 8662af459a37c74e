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




#include "inflate.hpp"
#include "hasopt.hpp"
#include <string.h>

#include <zlib.h>

namespace phrasegen {  namespace PHRASEGEN_SONAME {

struct Inflater::Data {
	z_stream zs;
	bool     started;
	bool     finished;
	int      last_error;
};

Inflater::Inflater()
{
	pimpl = new Data;
	pimpl->started = false;
	pimpl->finished = false;
	pimpl->last_error = Z_OK;
}

Inflater::~Inflater()
{
	if (pimpl->started) {
		inflateEnd (&pimpl->zs);
	}
	delete pimpl;
}


int Inflater::expand (const char *buf, size_t n, std::string *res)
{
	if (pimpl->last_error != Z_OK) {
		return pimpl->last_error;
	}
	if (!pimpl->started) {
		memset (&pimpl->zs, 0, sizeof pimpl->zs);
		// 15 bits of window, +32 to detect gzip and zlib headers.
		int rc = inflateInit2 (&pimpl->zs, 15 + 32);
		if (rc != Z_OK) {
			pimpl->last_error = rc;
			return rc;
		}
		pimpl->started = true;
	}
	if (pimpl->finished) {
		return Z_OK;
	}

	pimpl->zs.next_in  = (Bytef*) buf;
	pimpl->zs.avail_in = uInt(n);

	unsigned char out[16384];
	for (;;) {
		pimpl->zs.next_out  = out;
		pimpl->zs.avail_out = sizeof out;

		int rc = inflate (&pimpl->zs, Z_NO_FLUSH);
		if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
			pimpl->last_error = rc;
			return rc;
		}
		res->append ((const char*)out, sizeof out - pimpl->zs.avail_out);

		if (rc == Z_STREAM_END) {
			pimpl->finished = true;
			break;
		}
		// All input consumed and the output buffer was not filled.
		if (pimpl->zs.avail_out != 0) {
			break;
		}
	}
	return 0;
}


bool Inflater::finished() const
{
	return pimpl->finished;
}

std::string Inflater::error_message() const
{
	if (pimpl->last_error == Z_OK) {
		return std::string();
	}
	if (pimpl->started && pimpl->zs.msg) {
		return pimpl->zs.msg;
	}
	return zError (pimpl->last_error);
}


std::string inflate_all (const std::string &data)
{
	Inflater inf;
	std::string res;
	if (inf.expand (data.data(), data.size(), &res) != 0) {
		throw_rte (_("Cannot expand the compressed data: %s"), inf.error_message());
	}
	if (!inf.finished()) {
		throw_rte (_("The compressed data is truncated."));
	}
	return res;
}


}}
