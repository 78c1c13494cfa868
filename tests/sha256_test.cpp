#include <arch_staging/sha256.hpp>
#include <gtest/gtest.h>
#include <string>

using arch_staging::Sha256;

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(Sha256::hash_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Sha256::hash_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Sha256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256Test, MillionAs) {
    Sha256 h;
    const std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) h.update(chunk);
    EXPECT_EQ(h.final_hex(), "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const std::string text = "The quick brown fox jumps over the lazy dog, then over a second, rather lazier dog.";
    Sha256 h;
    for (std::size_t i = 0; i < text.size(); i += 7) h.update(std::string_view(text).substr(i, 7));
    EXPECT_EQ(h.final_hex(), Sha256::hash_hex(text));
}

TEST(Sha256Test, ContentHashFormat) {
    const auto hash = arch_staging::content_hash("abc");
    EXPECT_EQ(hash.rfind("sha256:", 0), 0u);
    EXPECT_EQ(hash.size(), 7u + 64u);
}
