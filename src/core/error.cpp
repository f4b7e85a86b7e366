#include "lanshare/core/error.hpp"

namespace lanshare::core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Crypto: return "crypto";
        case ErrorKind::IO: return "io";
        case ErrorKind::Network: return "network";
    }
    return "unknown";
}

}
