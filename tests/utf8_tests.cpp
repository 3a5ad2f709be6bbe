#include <cstdlib>
#include <iostream>
#include <string>
#include <wasmbox/support/utf8.h>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    using wasmbox::support::decode_lossy;
    using wasmbox::support::is_valid_utf8;

    const std::string replacement = "\xEF\xBF\xBD";

    {
        if (!is_valid_utf8("") || !is_valid_utf8("hello") || !is_valid_utf8("caf\xC3\xA9") ||
            !is_valid_utf8("\xE2\x82\xAC") || !is_valid_utf8("\xF0\x9F\x98\x80"))
        {
            fail("expected well-formed input to validate");
        }
    }

    // Overlong encodings, surrogates, values past U+10FFFF and truncated sequences.
    {
        const char* bad[] = {"\xC0\xAF", "\xE0\x80\xAF", "\xED\xA0\x80", "\xF4\x90\x80\x80",
                             "\xC3",     "\xE2\x82",     "\x80",         "\xFF"};
        for (const char* s : bad)
        {
            if (is_valid_utf8(s))
            {
                fail("expected ill-formed input to be rejected");
            }
        }
    }

    {
        if (decode_lossy("plain ascii") != "plain ascii")
        {
            fail("expected valid input to pass through unchanged");
        }
        if (decode_lossy("caf\xC3\xA9") != "caf\xC3\xA9")
        {
            fail("expected multi-byte characters to pass through unchanged");
        }
    }

    {
        const std::string out = decode_lossy("a\xFF" "b");
        if (out != "a" + replacement + "b")
        {
            fail("expected a single invalid byte to become U+FFFD");
        }
    }

    // A truncated sequence is one maximal subpart and gets a single replacement.
    {
        const std::string out = decode_lossy("x\xE2\x82y");
        if (out != "x" + replacement + "y")
        {
            fail("expected a truncated sequence to become one U+FFFD, got: " + out);
        }
    }

    {
        const std::string out = decode_lossy(std::string("\x00\xC0", 2));
        if (out != std::string("\x00", 1) + replacement)
        {
            fail("expected NUL to survive and a lone lead byte to be replaced");
        }
        if (!is_valid_utf8(decode_lossy("\xF5\xF6\xF7\xED\xA0\x80 tail")))
        {
            fail("expected lossy output to always be well-formed");
        }
    }

    std::cout << "OK\n";
    return 0;
}
