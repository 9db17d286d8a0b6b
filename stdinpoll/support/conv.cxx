// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/support/conv.hxx"

std::string hexPreview(const uint8_t * data, size_t size, size_t limit) {
    std::string str;

    for (size_t i = 0; i != size && i != limit; ++i) {
        char hex0, hex1;
        byteToHex(data[i], hex0, hex1);
        if (i != 0) { str.push_back(' '); }
        str.push_back(hex0);
        str.push_back(hex1);
    }

    if (size > limit) { str += " ..."; }

    return str;
}
