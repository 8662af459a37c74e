#ifndef PHRASEGEN_WORDLIST_HPP
#define PHRASEGEN_WORDLIST_HPP

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


// Word lists from which the passphrases are drawn.


#include "soname.hpp"
#include <stddef.h>
#include <iosfwd>
#include <string>
#include <vector>

namespace phrasegen {   inline  namespace PHRASEGEN_SONAME {


// Read only indexable sequence of words. The generator only sees this
// interface, whatever the origin of the words.
class EXPORTFN Word_source {
public:
	virtual ~Word_source() {}
	virtual size_t size() const = 0;
	virtual const std::string & operator[] (size_t i) const = 0;
};


class EXPORTFN Word_vector : public Word_source {
	std::vector<std::string> words;
public:
	Word_vector() {}
	explicit Word_vector (const std::vector<std::string> &w) : words(w) {}
	size_t size() const { return words.size(); }
	const std::string & operator[] (size_t i) const { return words[i]; }
	const std::vector<std::string> & all() const { return words; }
};


// The built in lists.
enum List_choice {
	list_medium,        // Orchard Street Medium List
	list_long,          // Orchard Street Long List
	list_eff,           // EFF long list
	list_mnemonicode,   // Mnemonicode list
	list_eff_short,     // EFF short list
	list_qwerty,        // Orchard Street QWERTY list
	list_alpha          // Orchard Street Alpha list
};

struct List_info {
	List_choice choice;
	char code;          // Letter used in the command line.
	const char *file;   // File name inside the list directory.
	const char *name;
	size_t size;        // Number of words of the published list.
};

EXPORTFN const List_info & list_info (List_choice c);

// Convert the command line letter (case insensitive) into a List_choice.
// Throws std::runtime_error if the letter does not name any list.
EXPORTFN List_choice parse_list_choice (const std::string &s);


// Read one word per line. Leading and trailing white space is removed,
// blank lines are ignored and the result is sorted without duplicates.
EXPORTFN std::vector<std::string> normalize_words (std::istream &is);

// Read a word list file. Files compressed with gzip are expanded. Throws
// std::runtime_error with the file name if the file cannot be read.
EXPORTFN Word_vector read_word_list (const std::string &path);


// Directory with the built in lists: the PHRASEGEN_LIST_DIR environment
// variable or the directory given when building.
EXPORTFN std::string default_list_dir ();

// Read the built in list c from the directory dir.
EXPORTFN Word_vector load_builtin_list (List_choice c, const std::string &dir);


}}

#endif
