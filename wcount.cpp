/*                        W C O U N T . C P P
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file wcount.cpp
 *
 * Print the byte and/or character count of a file, wc style, with explicit
 * control over the encoding used to decide what a character is.
 *
 * wcount -c <filename>
 * wcount -m [--encoding utf8|ascii] [--keep-bom] <filename>
 *
 * Byte counts come straight from the file size.  Character counts are
 * produced by decoding the file in chunks and counting codepoints; input
 * that isn't valid in the chosen encoding is reported as an error rather
 * than guessed at.
 *
 * Exit codes:
 *   0 - success
 *   1 - bad options or missing file argument
 *   2 - file could not be opened
 *   3 - byte count failed
 *   4 - character count failed (invalid or truncated input, read error)
 */

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cxxopts.hpp"

#include "wcount/byte_source.h"
#include "wcount/count.h"
#include "wcount/encoding.h"
#include "wcount/errors.h"

#define WCOUNT_VERSION "v0.0.1"

class count_opts {
    public:
	bool bytes = false;
	bool chars = false;
	bool keep_bom = false;
	bool verbose = false;
	size_t chunk_size = WCOUNT_DEFAULT_CHUNK_SIZE;
	std::string encoding = "utf8";
};

int
report_counts(const std::string &fname, const count_opts &p, wcount::Encoding enc)
{
    std::unique_ptr<wcount::FileSource> src;
    try {
	src = std::make_unique<wcount::FileSource>(fname);
    } catch (const wcount::SourceError &e) {
	std::cerr << "Error:  " << e.what() << "\n";
	return 2;
    }

    if (p.verbose) {
	std::cerr << "Counting " << fname << "\n";
	std::cerr << "    encoding:   " << wcount::encoding_name(enc) << "\n";
	if (p.chars) {
	    std::cerr << "    keep BOM:   " << (p.keep_bom ? "yes" : "no") << "\n";
	    std::cerr << "    chunk size: " << p.chunk_size << "\n";
	}
    }

    // -c: bytes come from the file length, the decoder is never involved
    if (p.bytes) {
	try {
	    uint64_t nbytes = wcount::count_bytes(*src);
	    std::cout << "bytes: " << nbytes << "\n";
	} catch (const wcount::SourceError &e) {
	    std::cerr << "Error:  failed to get byte count: " << e.what() << "\n";
	    return 3;
	}
    }

    // -m: a failed count prints nothing on stdout
    if (p.chars) {
	try {
	    uint64_t nchars = wcount::count_characters(*src, enc, p.keep_bom, p.chunk_size);
	    std::cout << "chars: " << nchars << "\n";
	} catch (const wcount::DecodeError &e) {
	    const char *kind = (e.kind() == wcount::DecodeError::TRUNCATED_INPUT) ? "truncated input" : "malformed input";
	    std::cerr << "Error:  " << fname << ": " << kind << ": " << e.what() << "\n";
	    return 4;
	} catch (const wcount::SourceError &e) {
	    std::cerr << "Error:  " << e.what() << "\n";
	    return 4;
	}
    }

    return 0;
}

int
main(int argc, const char *argv[])
{
    count_opts p;

    cxxopts::Options options(argv[0],
	    "Print byte and character counts for a file.\n"
	    "\n"
	    "wcount -c <filename>\n"
	    "wcount -m [--encoding utf8|ascii] [--keep-bom] <filename>\n"
	    "\n"
	    "With neither -c nor -m both counts are printed.  Characters are\n"
	    "Unicode codepoints; a UTF-8 byte order mark at the start of the\n"
	    "file is not counted unless --keep-bom is given.  Input that is not\n"
	    "valid in the selected encoding, including a multi-byte sequence cut\n"
	    "off by the end of the file, is reported as an error.\n"
	    );

    std::vector<std::string> nonopts;

    try
    {
	options
	    .set_width(70)
	    .positional_help("<filename>")
	    .add_options()
	    ("c,bytes",    "Print the byte count", cxxopts::value<bool>(p.bytes))
	    ("m,chars",    "Print the character count", cxxopts::value<bool>(p.chars))
	    ("encoding",   "Encoding used to count characters (utf8 or ascii)", cxxopts::value<std::string>(p.encoding)->default_value("utf8"))
	    ("keep-bom",   "Count a leading UTF-8 byte order mark as a character", cxxopts::value<bool>(p.keep_bom))
	    ("chunk-size", "Number of bytes read at a time when counting characters", cxxopts::value<size_t>(p.chunk_size)->default_value("4096"))
	    ("v,verbose",  "Report what is being counted on stderr", cxxopts::value<bool>(p.verbose))
	    ("version",    "Print version information and exit")
	    ("h,help",     "Print help")
	    ;
	auto result = options.parse(argc, argv);

	// Do we want help?
	if (result.count("help")) {
	    std::cout << options.help({""}) << std::endl;
	    return 0;
	}

	if (result.count("version")) {
	    std::cout << "wcount " << WCOUNT_VERSION << std::endl;
	    return 0;
	}

	nonopts = result.unmatched();
    }
    catch (const cxxopts::exceptions::exception& e)
    {
	std::cerr << "error parsing options: " << e.what() << std::endl;
	return 1;
    }

    /////////////////////////////////////////
    // Do some option checking and validation
    /////////////////////////////////////////

    wcount::Encoding enc = wcount::Encoding::UTF8;
    if (!wcount::parse_encoding(p.encoding, enc)) {
	std::cerr << "Error:  unknown encoding \"" << p.encoding << "\" - expected utf8 or ascii.\n";
	std::cout << options.help({""}) << std::endl;
	return 1;
    }

    if (!p.chunk_size) {
	std::cerr << "Error:  --chunk-size must be at least 1.\n";
	return 1;
    }

    if (nonopts.empty()) {
	std::cerr << "Error:  <filename> is required.\n";
	std::cout << options.help({""}) << std::endl;
	return 1;
    }
    if (nonopts.size() > 1) {
	std::cerr << "Error:  only one file may be counted at a time.\n";
	std::cout << options.help({""}) << std::endl;
	return 1;
    }

    if (p.keep_bom && enc == wcount::Encoding::ASCII)
	std::cerr << "Warning:  --keep-bom has no effect with the ascii encoding.\n";

    // No mode selected - report everything we know how to count
    if (!p.bytes && !p.chars)
	p.bytes = p.chars = true;

    return report_counts(nonopts[0], p, enc);
}

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
