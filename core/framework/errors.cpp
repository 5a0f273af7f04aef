#include "framework/errors.hpp"

namespace rebut {

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DUPLICATE_NODE: return "DuplicateNode";
        case ErrorKind::UNKNOWN_NODE:   return "UnknownNode";
        case ErrorKind::TOO_LARGE:      return "TooLarge";
    }
    return "Unknown";
}

} // namespace rebut
