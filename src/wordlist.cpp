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

#include "wordlist.hpp"
#include "inflate.hpp"
#include "misc.hpp"
#include "hasopt.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iterator>
#include <ctype.h>
#include <stdlib.h>

#ifndef PHRASEGEN_LIST_DIR_DEFAULT
	#define PHRASEGEN_LIST_DIR_DEFAULT "/usr/local/share/phrasegen"
#endif


namespace phrasegen {   namespace PHRASEGEN_SONAME {


static const List_info lists[] = {
	{ list_medium,      'm', "orchard-street-medium.txt", "Orchard Street Medium List", 8192 },
	{ list_long,        'l', "orchard-street-long.txt",   "Orchard Street Long List",  17576 },
	{ list_eff,         'e', "eff-long.txt",              "EFF long list",              7776 },
	{ list_mnemonicode, 'n', "mnemonicode.txt",           "Mnemonicode list",           1633 },
	{ list_eff_short,   's', "eff-short.txt",             "EFF short list",             1296 },
	{ list_qwerty,      'q', "orchard-street-qwerty.txt", "Orchard Street QWERTY list", 1296 },
	{ list_alpha,       'a', "orchard-street-alpha.txt",  "Orchard Street Alpha list",  1296 }
};


const List_info & list_info (List_choice c)
{
	for (size_t i = 0; i < sizeof lists / sizeof lists[0]; ++i) {
		if (lists[i].choice == c) {
			return lists[i];
		}
	}
	throw std::logic_error (_("list_info() called with an unknown List_choice"));
}


List_choice parse_list_choice (const std::string &s)
{
	if (s.size() == 1) {
		char c = tolower ((unsigned char)s[0]);
		for (size_t i = 0; i < sizeof lists / sizeof lists[0]; ++i) {
			if (lists[i].code == c) {
				return lists[i].choice;
			}
		}
	}
	throw_rte (_("Inputted list choice '%s' doesn't correspond to an available word list"), s);
	return list_medium;
}


std::vector<std::string> normalize_words (std::istream &is)
{
	std::vector<std::string> words;
	std::string line;
	while (std::getline (is, line)) {
		std::string w = trim (line);
		if (!w.empty()) {
			words.push_back (w);
		}
	}
	std::sort (words.begin(), words.end());
	words.erase (std::unique (words.begin(), words.end()), words.end());
	return words;
}


Word_vector read_word_list (const std::string &path)
{
	std::ifstream is (path.c_str(), std::ios::binary);
	if (!is) {
		throw_rte (_("Cannot open the word list file %s"), path);
	}
	std::string data ((std::istreambuf_iterator<char>(is)),
	                  std::istreambuf_iterator<char>());
	if (is.bad()) {
		throw_rte (_("Error while reading the word list file %s"), path);
	}

	if (is_gzip (data)) {
		try {
			data = inflate_all (data);
		} catch (std::exception &) {
			throw_nrte (_("The compressed word list %s is damaged"), path);
		}
	}

	std::istringstream ls (data);
	return Word_vector (normalize_words (ls));
}


std::string default_list_dir ()
{
	const char *env = getenv ("PHRASEGEN_LIST_DIR");
	if (env && *env) {
		return env;
	}
	return PHRASEGEN_LIST_DIR_DEFAULT;
}


Word_vector load_builtin_list (List_choice c, const std::string &dir)
{
	const List_info &li = list_info (c);
	std::string path = dir;
	if (!path.empty() && path[path.size() - 1] != '/') {
		path += '/';
	}
	path += li.file;

	try {
		return read_word_list (path);
	} catch (std::exception &) {
		throw_nrte (_("Cannot load the %s"), li.name);
	}
	return Word_vector();
}


}}
