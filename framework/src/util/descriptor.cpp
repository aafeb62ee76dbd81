#include <breakwater/util/descriptor.h>
#include <breakwater/exceptions.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace breakwater::util {

int duplicate_descriptor(int fd) {
    const int copy = ::dup(fd);
    if (copy < 0) {
        throw BreakwaterError("Cannot duplicate descriptor " + std::to_string(fd) + ": " + std::strerror(errno));
    }
    return copy;
}

} // namespace breakwater::util
