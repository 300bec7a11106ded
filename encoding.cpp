/*                      E N C O D I N G . C P P
 * BRL-CAD
 *
 * Published in 2025 by the United States Government.
 * This work is in the public domain.
 */

#include "wcount/encoding.h"

namespace wcount {

bool
parse_encoding(const std::string &name, Encoding &enc)
{
    if (name == "utf8") {
	enc = Encoding::UTF8;
	return true;
    }
    if (name == "ascii") {
	enc = Encoding::ASCII;
	return true;
    }
    return false;
}

const char *
encoding_name(Encoding enc)
{
    switch (enc) {
	case Encoding::UTF8:
	    return "utf8";
	case Encoding::ASCII:
	    return "ascii";
    }
    return "unknown";
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
