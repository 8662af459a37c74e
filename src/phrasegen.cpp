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




#include "hasopt.hpp"
#include "entropy.hpp"
#include "separator.hpp"
#include "wordlist.hpp"
#include "passphrase.hpp"
#include "random.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <stdlib.h>
#include <ctype.h>
#include <errno.h>

using  namespace phrasegen;

#ifndef PHRASEGEN_VERSION
	#define PHRASEGEN_VERSION "unknown"
#endif

enum {
	maximum_entropy = 10000,
	maximum_passphrases = 100000
};


void usage(std::ostream &os)
{
	os << _("usage is phrasegen [options]\n");
	os << _("Generate random passphrases. If neither -w nor -e is given the passphrase\n"
	        "has at least 80 bits of entropy.\n\n");
	os << _("-w N  --words N          use exactly N words, at most 1000\n");
	os << _("-e N  --minimum-entropy N\n"
	        "                         use enough words for at least N bits of entropy\n");
	os << _("-S    --strength         add 20 bits to the minimum entropy. May be repeated.\n");
	os << _("      --secure           never generate less than 105 bits of entropy\n");
	os << _("-s X  --sep X            word separator, default '-'. Single quotes around the\n"
	        "                         separator are removed. Special values:\n"
	        "                           _n  random digits\n"
	        "                           _s  random symbols\n"
	        "                           _b  random digits or symbols\n");
	os << _("-l C  --list C           built in word list, installed separately in the list\n"
	        "                         directory (see -d):\n"
	        "                           m  Orchard Street Medium List (8,192 words) [default]\n"
	        "                           l  Orchard Street Long List (17,576 words)\n"
	        "                           e  EFF long list (7,776 words)\n"
	        "                           n  Mnemonicode list (1,633 words)\n"
	        "                           s  EFF short list (1,296 words)\n"
	        "                           q  Orchard Street QWERTY list (1,296 words)\n"
	        "                           a  Orchard Street Alpha list (1,296 words)\n");
	os << _("-c F  --custom-list F    read the words from the file F, one per line. The\n"
	        "                         file may be compressed with gzip.\n");
	os << _("-d D  --list-dir D       directory of the built in lists. Defaults to the\n"
	        "                         PHRASEGEN_LIST_DIR environment variable or\n"
	        "                         ");
	os << default_list_dir() << '\n';
	os << _("-t    --title-case       capitalize the first letter of each word\n");
	os << _("-n N  --passphrases N    generate N passphrases\n");
	os << _("-v    --verbose          show the estimated entropy\n");
	os << _("-h    --help             show this help\n");
	os << _("      --version          show the version\n");
}


// Parse a decimal number between 1 and max.
static size_t parse_count(const char *val, const char *option, size_t max)
{
	const char *p = val;
	while (*p) {
		if (!isdigit((unsigned char)*p)) {
			throw_rte(_("The value of %s must be a positive number, not '%s'"), option, val);
		}
		++p;
	}
	errno = 0;
	char *strend;
	unsigned long long v = strtoull(val, &strend, 10);
	if (strend == val || errno == ERANGE || v == 0) {
		throw_rte(_("The value of %s must be a positive number, not '%s'"), option, val);
	}
	if (v > max) {
		throw_rte(_("The value of %s cannot be larger than %zu"), option, max);
	}
	return size_t(v);
}


struct Options {
	const char *words, *entropy, *sep, *list, *custom, *list_dir, *count;
	size_t strength;
	bool secure, title, verbose;

	Options() : words(NULL), entropy(NULL), sep("-"), list(NULL), custom(NULL),
	            list_dir(NULL), count(NULL), strength(0), secure(false),
	            title(false), verbose(false) {}
};


static Request make_request(const Options &opt)
{
	if (opt.words) {
		if (opt.entropy) {
			throw_rte(_("--words cannot be used together with --minimum-entropy"));
		}
		if (opt.strength) {
			throw_rte(_("--words cannot be used together with --strength"));
		}
		if (opt.secure) {
			throw_rte(_("--words cannot be used together with --secure"));
		}
		return Request::words(parse_count(opt.words, "--words", maximum_words));
	}

	Request req = Request::defaults();
	if (opt.entropy) {
		if (opt.strength) {
			throw_rte(_("--minimum-entropy cannot be used together with --strength"));
		}
		req = Request::entropy(parse_count(opt.entropy, "--minimum-entropy",
		                                    maximum_entropy));
	} else if (opt.strength) {
		req = Request::strength(opt.strength);
	}
	if (opt.secure) {
		req = secure_request(req);
	}
	return req;
}


static Word_vector load_words(const Options &opt)
{
	if (opt.custom) {
		if (opt.list) {
			throw_rte(_("--list cannot be used together with --custom-list"));
		}
		return read_word_list(opt.custom);
	}

	List_choice choice = opt.list ? parse_list_choice(opt.list) : list_medium;
	std::string dir = opt.list_dir ? opt.list_dir : default_list_dir();
	Word_vector words = load_builtin_list(choice, dir);

	const List_info &li = list_info(choice);
	if (words.size() != li.size) {
		format(std::cerr, _("Warning: the %s in %s has %zu words instead of %zu.\n"),
		       li.name, dir, words.size(), li.size);
	}
	return words;
}


int real_main(int argc, char **argv)
{
	Options opt;
	const char *val;

	if (hasopt_long(&argc, argv, "--help")) {
		usage(std::cout);
		return 0;
	}
	if (hasopt_long(&argc, argv, "--version")) {
		format(std::cout, "phrasegen %s\n", PHRASEGEN_VERSION);
		return 0;
	}

	if (hasopt_long(&argc, argv, "--words", &val)) {
		opt.words = val;
	}
	if (hasopt_long(&argc, argv, "--minimum-entropy", &val)) {
		opt.entropy = val;
	}
	while (hasopt_long(&argc, argv, "--strength")) {
		++opt.strength;
	}
	if (hasopt_long(&argc, argv, "--secure")) {
		opt.secure = true;
	}
	if (hasopt_long(&argc, argv, "--sep", &val)) {
		opt.sep = val;
	}
	if (hasopt_long(&argc, argv, "--list", &val)) {
		opt.list = val;
	}
	if (hasopt_long(&argc, argv, "--custom-list", &val)) {
		opt.custom = val;
	}
	if (hasopt_long(&argc, argv, "--list-dir", &val)) {
		opt.list_dir = val;
	}
	if (hasopt_long(&argc, argv, "--title-case")) {
		opt.title = true;
	}
	if (hasopt_long(&argc, argv, "--passphrases", &val)) {
		opt.count = val;
	}
	if (hasopt_long(&argc, argv, "--verbose")) {
		opt.verbose = true;
	}

	int op;
	while ((op = hasopt(&argc, argv, "w:e:Ss:l:c:d:tn:vh", &val)) != 0) {
		switch (op) {
		case 'w':
			opt.words = val;
			break;

		case 'e':
			opt.entropy = val;
			break;

		case 'S':
			++opt.strength;
			break;

		case 's':
			opt.sep = val;
			break;

		case 'l':
			opt.list = val;
			break;

		case 'c':
			opt.custom = val;
			break;

		case 'd':
			opt.list_dir = val;
			break;

		case 't':
			opt.title = true;
			break;

		case 'n':
			opt.count = val;
			break;

		case 'v':
			opt.verbose = true;
			break;

		case 'h':
			usage(std::cout);
			return 0;

		default:
			format(std::cerr, _("Unknown option or missing value: %s\n"), val);
			usage(std::cerr);
			return EXIT_FAILURE;
		}
	}

	if (argc > 1) {
		throw_rte(_("Unexpected argument '%s'. See phrasegen --help"), argv[1]);
	}

	Request req = make_request(opt);
	size_t count = opt.count ? parse_count(opt.count, "--passphrases", maximum_passphrases) : 1;
	Separator sep = parse_separator(opt.sep);

	if (opt.custom && sep.kind == Separator::literal && sep.text.empty() && !opt.title) {
		throw_rte(_("An empty separator with a custom list and without --title-case "
		            "could produce passphrases that cannot be split back into words. "
		            "Use another separator or --title-case."));
	}

	Word_vector words = load_words(opt);
	if (words.size() < 2) {
		throw_rte(_("The word list has %zu distinct words. At least 2 are needed."),
		          words.size());
	}

	size_t nwords = resolve_word_count(req, words.size());

	Chacha_random rng;
	std::vector<std::string> phrases;
	for (size_t i = 0; i < count; ++i) {
		phrases.push_back(generate_passphrase(nwords, sep, opt.title, words, rng));
	}
	for (size_t i = 0; i < phrases.size(); ++i) {
		std::cout << phrases[i] << '\n';
	}

	if (opt.verbose) {
		double bits = estimate_bits(nwords, words.size());
		if (count == 1) {
			format(std::cerr, _("Passphrase has an estimated %.2f bits of entropy "
			                    "(%zu words from a list of %zu words).\n"),
			       bits, nwords, words.size());
		} else {
			format(std::cerr, _("Passphrases have an estimated %.2f bits of entropy each "
			                    "(%zu words from a list of %zu words).\n"),
			       bits, nwords, words.size());
		}
	}
	return 0;
}


int main(int argc, char **argv)
{
	return run_main(argc, argv, real_main);
}
