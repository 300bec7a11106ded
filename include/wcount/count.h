/*                         C O U N T . H
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file count.h
 *
 * Byte and character counting.
 *
 * Character counting is done in a streaming fashion - the input arrives in
 * chunks of arbitrary size and a multi-byte UTF-8 sequence may be split
 * across any number of them.  DecodeSession holds the state that has to
 * survive from one chunk to the next:
 *
 *   - the partial sequence left at the end of the previous chunk (at most
 *     three bytes, always a valid prefix of some well-formed sequence)
 *   - whether the leading byte order mark decision has been made yet
 *   - the running codepoint total
 *
 * A session is good for exactly one stream.  Once feed() or finish() has
 * thrown the session should be discarded.
 */

#ifndef WCOUNT_COUNT_H
#define WCOUNT_COUNT_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "wcount/byte_source.h"
#include "wcount/encoding.h"

#define WCOUNT_DEFAULT_CHUNK_SIZE 4096

namespace wcount {

class DecodeSession {
    public:
	DecodeSession(Encoding enc, bool keep_bom);

	/* Consume the next chunk of the stream.  Throws DecodeError
	 * (MALFORMED_SEQUENCE) on the first invalid byte. */
	void feed(const char *data, size_t len);

	/* Declare the stream finished and return the total.  Throws
	 * DecodeError (TRUNCATED_INPUT) if a sequence is still incomplete. */
	uint64_t finish();

	uint64_t count() const { return codepoint_count_; }
	size_t pending() const { return pending_tail_.size(); }
	bool first_chunk() const { return is_first_chunk_; }
	Encoding encoding() const { return encoding_; }

    private:
	void count_ascii();
	void count_utf8(size_t start, size_t end);

	Encoding encoding_;
	bool keep_bom_;
	bool is_first_chunk_ = true;
	bool bom_decided_ = false;
	std::string pending_tail_;
	std::string work_;
	uint64_t codepoint_count_ = 0;

	// Stream offset of the first byte in work_
	uint64_t offset_ = 0;
};

/* Count the codepoints in src, reading chunk_bytes at a time. */
uint64_t count_characters(ByteSource &src, Encoding enc, bool keep_bom,
			  size_t chunk_bytes = WCOUNT_DEFAULT_CHUNK_SIZE);

/* Total length of src in bytes. */
uint64_t count_bytes(ByteSource &src);

} // namespace wcount

#endif /* WCOUNT_COUNT_H */

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
