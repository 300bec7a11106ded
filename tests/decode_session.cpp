/*                D E C O D E _ S E S S I O N . C P P
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file decode_session.cpp
 *
 * Exercise the streaming character counter against in-memory input,
 * forcing chunk boundaries at every possible position.
 */

#include <cstdint>
#include <iostream>
#include <string>

#include "wcount/byte_source.h"
#include "wcount/count.h"
#include "wcount/errors.h"

static int failures = 0;

static void
check(bool ok, const std::string &what)
{
    if (ok)
	return;
    std::cerr << "FAIL: " << what << "\n";
    failures++;
}

static uint64_t
count_stepped(const std::string &s, size_t step, wcount::Encoding enc = wcount::Encoding::UTF8, bool keep_bom = false)
{
    wcount::MemorySource src(s, step);
    return wcount::count_characters(src, enc, keep_bom);
}

// Expect counting to fail with the given kind at the given stream offset
static void
check_error(const std::string &s, size_t step, wcount::DecodeError::Kind kind, uint64_t offset,
	    const std::string &what, wcount::Encoding enc = wcount::Encoding::UTF8)
{
    try {
	uint64_t n = count_stepped(s, step, enc);
	check(false, what + ": expected an error, got a count of " + std::to_string(n));
    } catch (const wcount::DecodeError &e) {
	check(e.kind() == kind, what + ": wrong error kind (" + e.what() + ")");
	check(e.offset() == offset, what + ": expected offset " + std::to_string(offset) + ", got " + std::to_string(e.offset()));
    }
}

// "a", U+00E9, U+20AC, U+1F600, "z"
static const std::string mixed("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80z");
static const std::string bom("\xEF\xBB\xBF");

static void
test_ascii_input()
{
    const std::string s("The quick brown fox\njumps over the lazy dog.\r\n\t~!");
    for (size_t step = 1; step <= s.size(); ++step) {
	check(count_stepped(s, step) == s.size(), "ascii text under utf8, step " + std::to_string(step));
	check(count_stepped(s, step, wcount::Encoding::ASCII) == s.size(), "ascii text under ascii, step " + std::to_string(step));
    }
    std::string all;
    for (int c = 0; c < 0x80; ++c)
	all.push_back(static_cast<char>(c));
    check(count_stepped(all, 4096, wcount::Encoding::ASCII) == 128, "every 7-bit byte is a character");
}

static void
test_examples()
{
    check(count_stepped("", 4096) == 0, "empty input");
    check(count_stepped("", 4096, wcount::Encoding::ASCII) == 0, "empty input (ascii)");
    check(count_stepped("a\xF0\x9F\x98\x80" "b", 4096) == 3, "a U+1F600 b");
    check(count_stepped(mixed, 4096) == 5, "mixed widths");
}

static void
test_chunk_invariance()
{
    // Count with every read size, including ones that cut each sequence
    for (size_t step = 1; step <= mixed.size() + 1; ++step)
	check(count_stepped(mixed, step) == 5, "mixed widths, step " + std::to_string(step));

    // Two chunk split at every position
    std::string s = mixed + mixed + mixed;
    for (size_t cut = 0; cut <= s.size(); ++cut) {
	wcount::DecodeSession session(wcount::Encoding::UTF8, false);
	session.feed(s.data(), cut);
	session.feed(s.data() + cut, s.size() - cut);
	check(session.finish() == 15, "split at " + std::to_string(cut));
    }

    // A single sequence delivered one byte at a time
    wcount::DecodeSession session(wcount::Encoding::UTF8, false);
    const std::string grin("\xF0\x9F\x98\x80");
    for (size_t i = 0; i < grin.size(); ++i) {
	session.feed(&grin[i], 1);
	if (i + 1 < grin.size()) {
	    check(session.count() == 0, "partial sequence not counted yet");
	    check(session.pending() == i + 1, "partial sequence held back");
	}
    }
    check(session.pending() == 0, "completed sequence leaves no tail");
    check(session.finish() == 1, "sequence fed byte by byte");
}

static void
test_bom()
{
    for (size_t step = 1; step <= 6; ++step) {
	std::string sfx = " step " + std::to_string(step);
	check(count_stepped(bom + mixed, step) == count_stepped(mixed, step), "BOM dropped" + sfx);
	check(count_stepped(bom + mixed, step, wcount::Encoding::UTF8, true) == 1 + count_stepped(mixed, step), "BOM kept" + sfx);
	check(count_stepped(bom, step) == 0, "BOM alone, dropped" + sfx);
	check(count_stepped(bom, step, wcount::Encoding::UTF8, true) == 1, "BOM alone, kept" + sfx);
    }

    // Only the first three bytes of the stream can be a BOM
    check(count_stepped("a" + bom, 4096) == 2, "BOM after the start is a character");
    check(count_stepped(bom + bom, 1) == 1, "second BOM is a character");

    // Starts like a BOM but isn't one
    check(count_stepped("\xEF\xBB\xBE", 1) == 1, "U+FEFE is not a BOM");
    check(count_stepped("\xEF\xBF\xBD" "x", 2) == 2, "U+FFFD then x");

    // The BOM prefix alone is an unfinished sequence
    check_error("\xEF\xBB", 1, wcount::DecodeError::TRUNCATED_INPUT, 0, "BOM prefix at end of input");
    check_error("\xEF", 4096, wcount::DecodeError::TRUNCATED_INPUT, 0, "lone 0xEF");

    // ASCII has no notion of a BOM
    check_error(bom + "a", 4096, wcount::DecodeError::MALFORMED_SEQUENCE, 0, "BOM under ascii", wcount::Encoding::ASCII);
}

static void
test_truncated()
{
    check_error("\xC2", 4096, wcount::DecodeError::TRUNCATED_INPUT, 0, "lone 0xC2");
    check_error("a\xF0\x9F\x98", 4096, wcount::DecodeError::TRUNCATED_INPUT, 1, "three of four bytes");
    check_error("a\xF0\x9F\x98", 1, wcount::DecodeError::TRUNCATED_INPUT, 1, "three of four bytes, step 1");
    check_error(mixed + "\xE2\x82", 3, wcount::DecodeError::TRUNCATED_INPUT, mixed.size(), "two of three bytes after text");
}

static void
test_malformed()
{
    struct bad_case {
	const char *what;
	std::string bytes;
	uint64_t offset;
    };
    const bad_case cases[] = {
	{"stray continuation byte", std::string("ab\x80" "cd"), 2},
	{"overlong two byte", std::string("\xC0\x80"), 0},
	{"overlong two byte (C1)", std::string("x\xC1\xBF"), 1},
	{"overlong three byte", std::string("\xE0\x80\x80"), 0},
	{"overlong four byte", std::string("\xF0\x80\x80\x80"), 0},
	{"surrogate", std::string("z\xED\xA0\x80"), 1},
	{"above U+10FFFF", std::string("\xF4\x90\x80\x80"), 0},
	{"invalid lead 0xF5", std::string("\xF5\x80\x80\x80"), 0},
	{"invalid byte 0xFF", std::string("ok\xFF"), 2},
	{"lead followed by ascii", std::string("\xE2\x82z"), 0},
	{"sequence cut by next lead", std::string("\xC3\xC3\xA9"), 0},
    };

    for (const auto &c : cases) {
	for (size_t step = 1; step <= c.bytes.size(); ++step)
	    check_error(c.bytes, step, wcount::DecodeError::MALFORMED_SEQUENCE, c.offset,
			std::string(c.what) + ", step " + std::to_string(step));
    }

    // Valid extremes of each range
    check(count_stepped("\xC2\x80\xDF\xBF", 1) == 2, "U+0080 and U+07FF");
    check(count_stepped("\xE0\xA0\x80\xED\x9F\xBF\xEE\x80\x80", 2) == 3, "U+0800, U+D7FF, U+E000");
    check(count_stepped("\xF0\x90\x80\x80\xF4\x8F\xBF\xBF", 3) == 2, "U+10000 and U+10FFFF");

    // Bad bytes after a BOM report their real stream offset
    check_error(bom + "\x80", 4096, wcount::DecodeError::MALFORMED_SEQUENCE, 3, "stray byte after BOM");
}

static void
test_ascii_strict()
{
    check_error("caf\xC3\xA9", 4096, wcount::DecodeError::MALFORMED_SEQUENCE, 3, "UTF-8 text under ascii", wcount::Encoding::ASCII);
    check_error("abc\x80", 2, wcount::DecodeError::MALFORMED_SEQUENCE, 3, "high byte in second chunk", wcount::Encoding::ASCII);
}

static void
test_session_state()
{
    wcount::DecodeSession session(wcount::Encoding::UTF8, false);
    check(session.first_chunk(), "fresh session is before the first chunk");
    check(session.count() == 0 && session.pending() == 0, "fresh session is empty");
    session.feed("", 0);
    check(!session.first_chunk(), "zero length chunk still counts as the first");
    check(session.finish() == 0, "zero length stream");

    wcount::DecodeSession empty(wcount::Encoding::ASCII, false);
    check(empty.finish() == 0, "finish without any chunks");
    check(!empty.first_chunk(), "finish ends the first chunk state");

    // Count is only added once a whole chunk validates
    wcount::DecodeSession partial(wcount::Encoding::UTF8, false);
    partial.feed("abc", 3);
    try {
	partial.feed("de\xFF", 3);
	check(false, "0xFF accepted");
    } catch (const wcount::DecodeError &e) {
	check(e.kind() == wcount::DecodeError::MALFORMED_SEQUENCE, "0xFF is malformed");
	check(e.offset() == 5, "0xFF offset");
    }
    check(partial.count() == 3, "failed chunk adds nothing");
}

int
main()
{
    test_ascii_input();
    test_examples();
    test_chunk_invariance();
    test_bom();
    test_truncated();
    test_malformed();
    test_ascii_strict();
    test_session_state();

    if (failures) {
	std::cerr << failures << " check(s) failed\n";
	return 1;
    }
    std::cout << "decode_session: all checks passed\n";
    return 0;
}

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
