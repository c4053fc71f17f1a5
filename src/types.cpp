#include "types.h"

namespace filepunch {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::DISCOVERY: return "discovery error";
        case ErrorKind::TRAVERSAL_TIMEOUT: return "traversal timeout";
        case ErrorKind::HANDSHAKE: return "handshake error";
        case ErrorKind::REGISTRY_INCONSISTENCY: return "registry inconsistency";
        case ErrorKind::HASH_MISMATCH: return "hash mismatch";
        case ErrorKind::PORT_MAPPING: return "port mapping error";
    }
    return "unknown";
}

const char* peer_role_to_string(PeerRole role) {
    return role == PeerRole::PUBLISHER ? "publisher" : "subscriber";
}

} // namespace filepunch
