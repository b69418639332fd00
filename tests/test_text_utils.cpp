#include <catch2/catch.hpp>
#include "text_utils.hpp"

using namespace rag_engine;

TEST_CASE("sha256_hex matches the standard test vector", "[text_utils]") {
    REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(generate_doc_id("abc") == sha256_hex("abc"));
}

TEST_CASE("make_node_id is a stable UUID-shaped string", "[text_utils]") {
    auto id = make_node_id("doc", 0);
    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    REQUIRE(id == make_node_id("doc", 0));
    REQUIRE(id != make_node_id("doc", 1));
    REQUIRE(id != make_node_id("other", 0));
}

TEST_CASE("utf8_safe_substr never splits a code point", "[text_utils]") {
    const std::string s = "h\xC3\xA9llo";   // "héllo"
    REQUIRE(utf8_safe_substr(s, 2) == "h");
    REQUIRE(utf8_safe_substr(s, 3) == "h\xC3\xA9");
    REQUIRE(utf8_safe_substr(s, 100) == s);
    REQUIRE(utf8_safe_substr("\xE2\x82\xAC", 2).empty());   // "€" cut in the middle
}

TEST_CASE("tokenize lowercases and drops stopwords and punctuation", "[text_utils]") {
    auto tokens = tokenize("The Quick, brown-fox is HERE!");
    REQUIRE(tokens == std::vector<std::string>{"quick", "brown", "fox", "here"});
    REQUIRE(tokenize("  ... ").empty());
}

TEST_CASE("estimate_tokens divides length by the ratio", "[text_utils]") {
    REQUIRE(estimate_tokens(std::string(300, 'a'), 3.0) == 100);
    REQUIRE(estimate_tokens(std::string(8, 'a'), 3.0) == 2);
    REQUIRE(estimate_tokens("", 3.0) == 0);
    REQUIRE(trim("  x y \n") == "x y");
}
