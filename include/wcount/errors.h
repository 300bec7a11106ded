/*                        E R R O R S . H
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file errors.h
 *
 * Exceptions thrown by the byte sources and the character counter.
 * SourceError covers anything the operating system refused us, while
 * DecodeError covers bytes that are not valid in the requested encoding.
 */

#ifndef WCOUNT_ERRORS_H
#define WCOUNT_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wcount {

class SourceError : public std::runtime_error {
    public:
	explicit SourceError(const std::string &msg) : std::runtime_error(msg) {}
};

class DecodeError : public std::runtime_error {
    public:
	enum Kind {
	    MALFORMED_SEQUENCE,
	    TRUNCATED_INPUT
	};

	DecodeError(Kind kind, uint64_t offset, const std::string &msg)
	    : std::runtime_error(msg), kind_(kind), offset_(offset) {}

	Kind kind() const { return kind_; }

	// Stream offset of the first byte of the offending sequence
	uint64_t offset() const { return offset_; }

    private:
	Kind kind_;
	uint64_t offset_;
};

} // namespace wcount

#endif /* WCOUNT_ERRORS_H */

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
