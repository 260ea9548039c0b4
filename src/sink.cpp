#include "objcat/cat/sink.hpp"
#include "objcat/core/log.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace objcat {

bool FdSink::write(std::span<const uint8_t> bytes) {
    if (last_error_ != 0) {
        return false;
    }

    const uint8_t* p = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            last_error_ = errno;
            if (last_error_ != EPIPE) {
                log_debug("output write failed: %s", strerror(last_error_));
            }
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Writes are unbuffered; a flush only reports an earlier failure
bool FdSink::flush() {
    return last_error_ == 0;
}

} // namespace objcat
