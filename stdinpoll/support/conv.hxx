// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__CONV__HXX
#define SUPPORT__CONV__HXX

#include "stdinpoll/support/debug.hxx"
#include "stdinpoll/support/exception.hxx"

#include <string>
#include <sstream>
#include <type_traits>
#include <cstdint>

namespace detail {

template <typename T>
void to_ostream(std::ostream & ost, const T & v) {
    ost << v;
}

inline void to_ostream(std::ostream & ost, const bool & v) {
    std::ios_base::fmtflags flags = ost.flags(); // stash current format flags
    ost << std::boolalpha << v;
    ost.flags(flags); // reset to previous format flags
}

template <typename T, typename... Args>
void to_ostream(std::ostream & ost, const T & first, const Args &... remaining) {
    to_ostream(ost, first);
    to_ostream(ost, remaining...);
}

} // namespace detail

template <typename T, typename... Args>
std::string stringify(const T & first, const Args &... remaining) {
    std::ostringstream ost;
    detail::to_ostream(ost, first, remaining...);
    return ost.str();
}

// Throws ConversionError unless all of str converts. For unsigned types a
// leading '-' is an error rather than a wrap-around.
template <typename T>
T unstringify(const std::string & str) {
    if constexpr (std::is_unsigned_v<T>) {
        auto i = str.find_first_not_of(" \t");
        THROW_UNLESS(i == std::string::npos || str[i] != '-',
                     ConversionError("Negative value: '" + str + "'"));
    }

    std::istringstream ist(str + '\n');
    auto t = T{};
    ist >> t;
    THROW_UNLESS(ist.good(), ConversionError("Failed to unstringify: '" + str + "'"));
    return t;
}

template <>
inline std::string unstringify<>(const std::string & str) {
    return str;
}

inline char nibbleToHex(uint8_t nibble) {
    ASSERT(nibble < 0x10, );
    if (nibble < 0xA) { return '0' +  nibble;       }
    else              { return 'A' + (nibble - 10); }
}

inline void byteToHex(uint8_t byte, char & hex0, char & hex1) {
    hex0 = nibbleToHex((byte >> 4) & 0x0F);
    hex1 = nibbleToHex(byte & 0x0F);
}

// "68 65 6C 6C 6F ..." - at most 'limit' bytes, then an ellipsis.
std::string hexPreview(const uint8_t * data, size_t size, size_t limit = 16);

inline std::string humanSize(size_t bytes) {
    const char * UNITS[] = {
        "B",
        "KB",
        "MB",
        "GB",
        "TB",
        "PB",
        "EB"
    };

    auto offset = 0;
    auto value  = bytes;

    while (value >= 1024) {
        value /= 1024;
        ++offset;
    }

    std::ostringstream ost;
    ost << value << UNITS[offset];
    return ost.str();
}

#endif // SUPPORT__CONV__HXX
