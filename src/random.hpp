#ifndef PHRASEGEN_RANDOM_HPP
#define PHRASEGEN_RANDOM_HPP

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


// Cryptographically secure random numbers.


#include "soname.hpp"
#include <stdint.h>
#include <stddef.h>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {


// Compute one ChaCha20 block. kn[0..7] is the key, kn[8..9] the block
// number and kn[10..11] the nonce, as in Bernstein's 64 bit nonce variant.
EXPORTFN void chacha20 (uint8_t out[64], const uint32_t kn[12]);


// Fill p[0..n[ with bytes from the operating system's random source. It
// reads /dev/urandom and falls back to std::random_device. Throws
// std::runtime_error if no source is available.
EXPORTFN void system_random_bytes (void *p, size_t n);


// Source of random bytes. All the generators take the source by reference,
// so that the tests can substitute a scripted one.
class EXPORTFN Random_source {
public:
	virtual ~Random_source() {}
	virtual void get_bytes (void *buf, size_t n) = 0;
	uint32_t get32();
};


// ChaCha20 keystream generator. The default constructor seeds it with 40
// bytes from system_random_bytes(). It is never reseeded afterwards: each
// call continues the keystream, so successive draws are independent and a
// run never repeats itself. Pass a 32 byte seed to obtain a reproducible
// stream.

// Not thread safe. Use one instance per thread.
class EXPORTFN Chacha_random : public Random_source {
	uint32_t state[12];
	uint8_t buf[64];
	int buf_next;

	void next_block();

	Chacha_random (const Chacha_random&);
	Chacha_random & operator= (const Chacha_random&);
public:
	Chacha_random ();
	explicit Chacha_random (const uint8_t seed[32], uint64_t nonce = 0);
	~Chacha_random ();

	void get_bytes (void *out, size_t n);
};


// Return a uniformly distributed integer in [0, n). 32 bit values below
// 2³² mod n are discarded before reducing modulo n, so that every residue
// has exactly the same number of preimages. Throws std::invalid_argument
// if n is zero.
EXPORTFN uint32_t uniform_below (Random_source &rng, uint32_t n);


}}

#endif
