// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/support/conv.hxx"
#include "stdinpoll/support/test.hxx"

namespace {

void testHex(Test & test, uint8_t num, const std::string & ascii) {
    char hex0, hex1;
    byteToHex(num, hex0, hex1);
    test.enforceEqual(std::string{hex0, hex1}, ascii, "byte --> hex");
}

void testHexPreview(Test & test) {
    const uint8_t data[] = { 'h', 'i', 0x00, 0xFF };
    test.enforceEqual(hexPreview(data, sizeof data), std::string("68 69 00 FF"), "whole");
    test.enforceEqual(hexPreview(data, sizeof data, 2), std::string("68 69 ..."), "truncated");
    test.enforceEqual(hexPreview(data, 0), std::string(""), "nothing");
}

void testUnstringify(Test & test) {
    test.enforceEqual(unstringify<size_t>("4096"), static_cast<size_t>(4096), "size_t");
    test.enforceEqual(unstringify<uint32_t>(" 250"), static_cast<uint32_t>(250), "uint32_t");
    test.enforceEqual(unstringify<int>("-1"), -1, "negative int");
    test.enforceEqual(unstringify<std::string>("a b"), std::string("a b"), "string");

    auto throwsConversionError = [](auto convert) {
        try {
            convert();
            return false;
        }
        catch (const ConversionError &) {
            return true;
        }
    };

    test.enforce(throwsConversionError([] { unstringify<uint32_t>("-1"); }),
                 "negative unsigned rejected");
    test.enforce(throwsConversionError([] { unstringify<size_t>(" -4096"); }),
                 "negative unsigned rejected after blanks");
    test.enforce(throwsConversionError([] { unstringify<uint32_t>("4294967296"); }),
                 "out of range rejected");

    try {
        unstringify<int>("many");
        test.enforce(false, "non-number throws");
    }
    catch (const ConversionError &) {
        test.enforce(true, "non-number throws");
    }
}

} // namespace {anonymous}

int main() {
    Test test("support/conv");

    test.run("hex-00", &testHex, 0, "00");
    test.run("hex-FF", &testHex, 255, "FF");
    test.run("hex-7F", &testHex, 127, "7F");
    test.run("hex-preview", &testHexPreview);
    test.run("unstringify", &testUnstringify);
    test.enforceEqual(humanSize(4096), std::string("4KB"), "human size");

    return 0;
}
