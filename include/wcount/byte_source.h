/*                   B Y T E _ S O U R C E . H
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file byte_source.h
 *
 * Chunked readers feeding the counters.  A source hands out bytes in
 * blocks of at most max_bytes and returns 0 once it is exhausted (and on
 * every read after that).  Read failures throw wcount::SourceError.
 */

#ifndef WCOUNT_BYTE_SOURCE_H
#define WCOUNT_BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace wcount {

class ByteSource {
    public:
	virtual ~ByteSource() = default;

	// Copy up to max_bytes into buf, returning the count copied.
	virtual size_t read_chunk(char *buf, size_t max_bytes) = 0;

	// Total length of the stream, independent of how much was read.
	virtual uint64_t total_bytes() = 0;
};

class FileSource : public ByteSource {
    public:
	explicit FileSource(const std::string &fname);

	size_t read_chunk(char *buf, size_t max_bytes) override;
	uint64_t total_bytes() override;

	const std::string &name() const { return fname_; }

    private:
	std::string fname_;
	std::ifstream fs_;
	bool eof_ = false;
};

/* In-memory source.  max_read caps the size of each chunk handed out so
 * callers can force chunk boundaries at arbitrary positions. */
class MemorySource : public ByteSource {
    public:
	explicit MemorySource(std::string data, size_t max_read = 0);

	size_t read_chunk(char *buf, size_t max_bytes) override;
	uint64_t total_bytes() override { return data_.size(); }

    private:
	std::string data_;
	size_t max_read_;
	size_t pos_ = 0;
};

} // namespace wcount

#endif /* WCOUNT_BYTE_SOURCE_H */

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
