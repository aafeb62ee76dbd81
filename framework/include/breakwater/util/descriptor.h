#ifndef BREAKWATER_UTIL_DESCRIPTOR_H
#define BREAKWATER_UTIL_DESCRIPTOR_H

namespace breakwater::util {

/**
 * @brief dup(2) that reports failure instead of returning -1.
 * The caller owns the returned descriptor.
 * @throws BreakwaterError with the errno text.
 */
int duplicate_descriptor(int fd);

} // namespace breakwater::util

#endif // BREAKWATER_UTIL_DESCRIPTOR_H
