#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::Configuration:      return "configuration";
        case ErrorKind::Authentication:     return "authentication";
        case ErrorKind::Connection:         return "connection";
        case ErrorKind::NotConnected:       return "not connected";
        case ErrorKind::RemoteNotFound:     return "remote not found";
        case ErrorKind::LocalNotFound:      return "local not found";
        case ErrorKind::Permission:         return "permission denied";
        case ErrorKind::IO:                 return "i/o";
        case ErrorKind::Remote:             return "remote";
        case ErrorKind::NothingMatched:     return "nothing matched";
        case ErrorKind::AllTransfersFailed: return "all transfers failed";
    }
    return "unknown";
}

size_t BatchReport::succeeded() const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.ok()) n++;
    }
    return n;
}

std::uint64_t BatchReport::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& r : results) {
        total += r.bytes_transferred;
    }
    return total;
}
