/*                         C O U N T . C P P
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file count.cpp
 *
 * Streaming byte and character counters.
 *
 * Chunk boundaries don't respect UTF-8 sequence boundaries, so at the end
 * of each chunk we look back (at most three bytes) for the lead byte of the
 * last sequence.  If the sequence it starts needs more bytes than the chunk
 * has left, those bytes are held back and glued onto the front of the next
 * chunk.  Everything before that point is complete and gets validated and
 * counted immediately.
 */

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "wcount/count.h"
#include "wcount/errors.h"

namespace wcount {

namespace {

const std::string utf8_bom("\xEF\xBB\xBF");

inline unsigned char
byte_at(const std::string &s, size_t i)
{
    return static_cast<unsigned char>(s[i]);
}

inline bool
is_cont(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

// Length of the sequence c starts, or 0 if c can never start one.
// 0xC0, 0xC1 would only produce overlong forms and 0xF5 and up would
// encode values past U+10FFFF.
inline size_t
lead_length(unsigned char c)
{
    if (c < 0x80)
	return 1;
    if (c >= 0xC2 && c <= 0xDF)
	return 2;
    if (c >= 0xE0 && c <= 0xEF)
	return 3;
    if (c >= 0xF0 && c <= 0xF4)
	return 4;
    return 0;
}

// The second byte carries the remaining range restrictions: overlong
// three and four byte forms, UTF-16 surrogates and the upper limit.
inline bool
second_ok(unsigned char lead, unsigned char c)
{
    switch (lead) {
	case 0xE0:
	    return c >= 0xA0 && c <= 0xBF;
	case 0xED:
	    return c >= 0x80 && c <= 0x9F;
	case 0xF0:
	    return c >= 0x90 && c <= 0xBF;
	case 0xF4:
	    return c >= 0x80 && c <= 0x8F;
	default:
	    return is_cont(c);
    }
}

// Number of trailing bytes of s, looking no further back than start, that
// begin a sequence but don't finish it.
size_t
trailing_partial(const std::string &s, size_t start)
{
    size_t len = s.size() - start;
    size_t back = (len < 3) ? len : 3;
    for (size_t k = 1; k <= back; ++k) {
	unsigned char c = byte_at(s, s.size() - k);
	if (is_cont(c))
	    continue;
	return (lead_length(c) > k) ? k : 0;
    }
    return 0;
}

// True if the bytes of s from pos on could still be completed into a well
// formed sequence.
bool
valid_prefix(const std::string &s, size_t pos)
{
    size_t len = s.size() - pos;
    if (!len || lead_length(byte_at(s, pos)) <= len)
	return false;
    if (len > 1 && !second_ok(byte_at(s, pos), byte_at(s, pos + 1)))
	return false;
    for (size_t i = pos + 2; i < s.size(); ++i) {
	if (!is_cont(byte_at(s, i)))
	    return false;
    }
    return true;
}

DecodeError
malformed(uint64_t offset, const std::string &what)
{
    std::ostringstream ss;
    ss << what << " at byte offset " << offset;
    return DecodeError(DecodeError::MALFORMED_SEQUENCE, offset, ss.str());
}

} // anonymous namespace

DecodeSession::DecodeSession(Encoding enc, bool keep_bom)
    : encoding_(enc), keep_bom_(keep_bom)
{
    pending_tail_.reserve(4);
}

void
DecodeSession::count_ascii()
{
    for (size_t i = 0; i < work_.size(); ++i) {
	unsigned char c = byte_at(work_, i);
	if (c < 0x80)
	    continue;
	std::ostringstream ss;
	ss << "non-ASCII byte 0x" << std::hex << std::uppercase
	   << std::setw(2) << std::setfill('0') << static_cast<unsigned>(c);
	throw malformed(offset_ + i, ss.str());
    }
    codepoint_count_ += work_.size();
}

void
DecodeSession::count_utf8(size_t start, size_t end)
{
    // offset_ still points at the start of work_
    uint64_t n = 0;
    size_t i = start;
    while (i < end) {
	unsigned char c = byte_at(work_, i);
	if (c < 0x80) {
	    ++i;
	    ++n;
	    continue;
	}
	size_t slen = lead_length(c);
	if (!slen)
	    throw malformed(offset_ + i, "invalid UTF-8 lead byte");
	if (i + slen > end || !second_ok(c, byte_at(work_, i + 1)))
	    throw malformed(offset_ + i, "invalid UTF-8 sequence");
	for (size_t k = 2; k < slen; ++k) {
	    if (!is_cont(byte_at(work_, i + k)))
		throw malformed(offset_ + i, "invalid UTF-8 sequence");
	}
	i += slen;
	++n;
    }
    codepoint_count_ += n;
}

void
DecodeSession::feed(const char *data, size_t len)
{
    is_first_chunk_ = false;

    work_.assign(pending_tail_);
    work_.append(data, len);
    pending_tail_.clear();

    size_t n = work_.size();

    switch (encoding_) {
	case Encoding::ASCII:
	    count_ascii();
	    offset_ += n;
	    return;
	case Encoding::UTF8:
	    break;
    }

    size_t start = 0;
    if (!bom_decided_) {
	// The decision needs the first three bytes of the stream, however
	// many chunks it takes to get them.
	if (n < 3 && utf8_bom.compare(0, n, work_) == 0) {
	    pending_tail_.swap(work_);
	    return;
	}
	bom_decided_ = true;
	if (!keep_bom_ && work_.compare(0, 3, utf8_bom) == 0)
	    start = 3;
    }

    size_t tail = trailing_partial(work_, start);
    size_t end = n - tail;
    count_utf8(start, end);

    if (tail) {
	if (!valid_prefix(work_, end))
	    throw malformed(offset_ + end, "invalid UTF-8 sequence");
	pending_tail_.assign(work_, end, tail);
    }
    offset_ += end;
}

uint64_t
DecodeSession::finish()
{
    is_first_chunk_ = false;

    if (!pending_tail_.empty()) {
	std::ostringstream ss;
	ss << "input ends inside a multi-byte sequence at byte offset " << offset_;
	throw DecodeError(DecodeError::TRUNCATED_INPUT, offset_, ss.str());
    }
    return codepoint_count_;
}

uint64_t
count_characters(ByteSource &src, Encoding enc, bool keep_bom, size_t chunk_bytes)
{
    if (!chunk_bytes)
	throw std::invalid_argument("chunk size must be at least one byte");

    DecodeSession session(enc, keep_bom);
    std::vector<char> buf(chunk_bytes);
    while (true) {
	size_t n = src.read_chunk(buf.data(), buf.size());
	if (!n)
	    break;
	session.feed(buf.data(), n);
    }
    return session.finish();
}

uint64_t
count_bytes(ByteSource &src)
{
    return src.total_bytes();
}

} // namespace wcount

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
