/*                      E N C O D I N G . H
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */
/** @file encoding.h
 *
 * Text encodings understood by the character counter.
 */

#ifndef WCOUNT_ENCODING_H
#define WCOUNT_ENCODING_H

#include <string>

namespace wcount {

enum class Encoding {
    UTF8,
    ASCII
};

/* Map a command line name ("utf8", "ascii") to an Encoding.  Returns false
 * and leaves enc untouched if the name is not recognized. */
bool parse_encoding(const std::string &name, Encoding &enc);

const char *encoding_name(Encoding enc);

} // namespace wcount

#endif /* WCOUNT_ENCODING_H */

// Local Variables:
// tab-width: 8
// mode: C++
// c-basic-offset: 4
// indent-tabs-mode: t
// c-file-style: "stroustrup"
// End:
// ex: shiftwidth=4 tabstop=8
