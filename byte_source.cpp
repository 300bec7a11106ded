/*                   B Y T E _ S O U R C E . C P P
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include "wcount/byte_source.h"
#include "wcount/errors.h"

namespace wcount {

FileSource::FileSource(const std::string &fname)
    : fname_(fname)
{
    // Directories and the like open fine but have no byte count to give
    std::error_code ec;
    if (!std::filesystem::is_regular_file(fname, ec))
	throw SourceError("Unable to open file " + fname);

    fs_.open(fname, std::ios::binary);
    if (!fs_.is_open())
	throw SourceError("Unable to open file " + fname);
}

size_t
FileSource::read_chunk(char *buf, size_t max_bytes)
{
    if (eof_ || !max_bytes)
	return 0;

    fs_.read(buf, static_cast<std::streamsize>(max_bytes));
    if (fs_.bad())
	throw SourceError("Unable to read file " + fname_);
    size_t n = static_cast<size_t>(fs_.gcount());

    // A short read sets eofbit and failbit.  Remember that we're done and
    // clear the flags so total_bytes() can still seek.
    if (fs_.eof()) {
	eof_ = true;
	fs_.clear();
    }
    return n;
}

uint64_t
FileSource::total_bytes()
{
    std::streampos cur = fs_.tellg();
    if (cur == std::streampos(-1))
	throw SourceError("Unable to get byte count for " + fname_);

    fs_.seekg(0, std::ios::end);
    std::streampos end = fs_.tellg();
    fs_.seekg(cur);
    if (end == std::streampos(-1) || !fs_)
	throw SourceError("Unable to get byte count for " + fname_);

    return static_cast<uint64_t>(end);
}

MemorySource::MemorySource(std::string data, size_t max_read)
    : data_(std::move(data)), max_read_(max_read)
{
}

size_t
MemorySource::read_chunk(char *buf, size_t max_bytes)
{
    size_t n = std::min(max_bytes, data_.size() - pos_);
    if (max_read_)
	n = std::min(n, max_read_);
    if (n)
	std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return n;
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
