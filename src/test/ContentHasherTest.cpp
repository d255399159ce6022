#include <cassert>
#include <iostream>

#include "infrastructure/ContentHasher.hpp"

using clara::infrastructure::ContentHasher;

int main() {
    std::cout << "[Test] Starting ContentHasher Test..." << std::endl;

    // Known SHA-256 vector.
    assert(ContentHasher::Sha256Hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    // Line digests ignore surrounding whitespace only.
    assert(ContentHasher::HashLine("Hello.").size() == 16);
    assert(ContentHasher::HashLine("  Hello.\t") == ContentHasher::HashLine("Hello."));
    assert(ContentHasher::HashLine("Hello.\r") == ContentHasher::HashLine("Hello."));
    assert(ContentHasher::HashLine("Hel lo.") != ContentHasher::HashLine("Hello."));
    assert(ContentHasher::HashLine("") == ContentHasher::HashLine("   "));

    // Document digests see every byte.
    assert(ContentHasher::HashDocument("a\nb\n").size() == 32);
    assert(ContentHasher::HashDocument("a\nb\n") != ContentHasher::HashDocument("a\nb"));
    assert(ContentHasher::HashDocument("a\nb\n") == ContentHasher::HashDocument("a\nb\n"));

    // Segment digests are whitespace sensitive.
    assert(ContentHasher::HashSegment("One. Two.").size() == 16);
    assert(ContentHasher::HashSegment("One. Two.") != ContentHasher::HashSegment("One.  Two."));
    assert(ContentHasher::HashSegment("One. Two.") != ContentHasher::HashSegment("One. Two!"));

    std::cout << "[PASS] ContentHasher Test." << std::endl;
    return 0;
}
