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

#include "random.hpp"
#include "misc.hpp"
#include "hasopt.hpp"
#include <string.h>
#include <fstream>
#include <random>
#include <stdexcept>


namespace phrasegen {    namespace PHRASEGEN_SONAME {


inline uint32_t rotl32 (uint32_t w, unsigned c)
{
	return (w << c) | (w >> (32 - c));
}

inline void chacha_quarterround (uint32_t x[16], int a, int b, int c, int d)
{
	x[a] += x[b];  x[d] = rotl32 (x[d] ^ x[a], 16);
	x[c] += x[d];  x[b] = rotl32 (x[b] ^ x[c], 12);
	x[a] += x[b];  x[d] = rotl32 (x[d] ^ x[a], 8);
	x[c] += x[d];  x[b] = rotl32 (x[b] ^ x[c], 7);
}


static const uint32_t sigma[4] = {
	0x61707865, 0x3320646e, 0x79622d32, 0x6b206574
};

void chacha20 (uint8_t out[64], const uint32_t kn[12])
{
	uint32_t input[16], x[16];
	memcpy (input, sigma, sizeof sigma);
	memcpy (input + 4, kn, 12 * 4);
	memcpy (x, input, sizeof x);

	for (int i = 0; i < 10; ++i) {
		// Column round.
		chacha_quarterround (x, 0, 4,  8, 12);
		chacha_quarterround (x, 1, 5,  9, 13);
		chacha_quarterround (x, 2, 6, 10, 14);
		chacha_quarterround (x, 3, 7, 11, 15);
		// Diagonal round.
		chacha_quarterround (x, 0, 5, 10, 15);
		chacha_quarterround (x, 1, 6, 11, 12);
		chacha_quarterround (x, 2, 7,  8, 13);
		chacha_quarterround (x, 3, 4,  9, 14);
	}

	for (int i = 0; i < 16; ++i) {
		leput32 (out + 4*i, x[i] + input[i]);
	}
	crypto_bzero (x, sizeof x);
	crypto_bzero (input, sizeof input);
}



// Get random bytes from /dev/urandom. Return 0 on success.
static int read_urandom (void *vp, size_t n)
{
	std::ifstream is;
	is.rdbuf()->pubsetbuf(0, 0);    // Make it non buffered.
	is.open("/dev/urandom", is.binary);
	if (!is) {
		return -1;
	}
	is.read((char*)vp, n);
	if (is.gcount() != std::streamsize(n)) {
		return -1;
	}
	return 0;
}

// The standard does not require std::random_device to be unpredictable, so
// it is only used when /dev/urandom is not available.
static void cxx_random_device (void *vp, size_t n)
{
	std::random_device rd;
	typedef std::random_device::result_type Re;

	uint8_t *dest = (uint8_t*) vp;
	while (n > 0) {
		Re v = rd();
		size_t k = n < sizeof v ? n : sizeof v;
		memcpy (dest, &v, k);
		dest += k;
		n -= k;
	}
}

void system_random_bytes (void *p, size_t n)
{
	if (read_urandom (p, n) == 0) {
		return;
	}
	try {
		cxx_random_device (p, n);
	} catch (std::exception &) {
		throw_nrte (_("Cannot obtain random bytes from the operating system."));
	}
}



uint32_t Random_source::get32()
{
	uint8_t b[4];
	get_bytes (b, sizeof b);
	return leget32 (b);
}



Chacha_random::Chacha_random ()
{
	uint8_t seed[40];
	Janitor jan (seed, sizeof seed);

	system_random_bytes (seed, sizeof seed);
	for (int i = 0; i < 8; ++i) {
		state[i] = leget32 (seed + 4*i);
	}
	state[8] = state[9] = 0;
	state[10] = leget32 (seed + 32);
	state[11] = leget32 (seed + 36);
	buf_next = 64;
}

Chacha_random::Chacha_random (const uint8_t seed[32], uint64_t nonce)
{
	for (int i = 0; i < 8; ++i) {
		state[i] = leget32 (seed + 4*i);
	}
	state[8] = state[9] = 0;
	state[10] = nonce & 0xFFFFFFFF;
	state[11] = nonce >> 32;
	buf_next = 64;
}

Chacha_random::~Chacha_random ()
{
	crypto_bzero (state, sizeof state);
	crypto_bzero (buf, sizeof buf);
}

void Chacha_random::next_block ()
{
	chacha20 (buf, state);
	if (++state[8] == 0) state[9]++;
	buf_next = 0;
}

void Chacha_random::get_bytes (void *vp, size_t n)
{
	uint8_t *out = (uint8_t*) vp;
	while (n > 0) {
		if (buf_next == 64) {
			next_block();
		}
		size_t k = 64 - buf_next;
		if (k > n) k = n;
		memcpy (out, buf + buf_next, k);
		// Consumed output is not kept around.
		memset (buf + buf_next, 0, k);
		buf_next += k;
		out += k;
		n -= k;
	}
}



uint32_t uniform_below (Random_source &rng, uint32_t n)
{
	if (n == 0) {
		throw std::invalid_argument (_("uniform_below() called with an empty range"));
	}
	// 2³² mod n computed in 32 bits.
	uint32_t low = (uint32_t(0) - n) % n;
	uint32_t val;
	do {
		val = rng.get32();
	} while (val < low);
	return val % n;
}


}}
