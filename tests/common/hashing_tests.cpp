#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/common/Hashing.h"
#include "../../include/sitewatch/common/IdGenerator.h"

#include <set>
#include <stdexcept>

using namespace sitewatch::common;

TEST_CASE("Hashing - sha256Hex matches known digests", "[Hashing]") {
    REQUIRE(sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256Raw("abc").size() == 32);
}

TEST_CASE("Hashing - base64", "[Hashing]") {
    REQUIRE(base64Encode("hello") == "aGVsbG8=");
    REQUIRE(base64Decode("aGVsbG8=") == "hello");
    REQUIRE_THROWS_AS(base64Decode("not*base64"), std::invalid_argument);
}

TEST_CASE("IdGenerator - ids are unique canonical uuids", "[IdGenerator]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = generateId();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[14] == '4');
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}
