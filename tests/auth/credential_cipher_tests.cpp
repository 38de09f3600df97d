#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/auth/CredentialCipher.h"

#include <stdexcept>

using namespace sitewatch::auth;

TEST_CASE("CredentialCipher - Round trip", "[CredentialCipher]") {
    CredentialCipher cipher("operator-secret");
    const std::string payload = R"({"username":"alice","password":"s3cret"})";

    std::string sealed = cipher.encrypt(payload);
    REQUIRE(sealed != payload);
    REQUIRE(sealed.find("s3cret") == std::string::npos);
    REQUIRE(cipher.decrypt(sealed) == payload);

    SECTION("Every encryption uses a fresh IV") {
        REQUIRE(cipher.encrypt(payload) != sealed);
    }

    SECTION("Empty plaintext") {
        REQUIRE(cipher.decrypt(cipher.encrypt("")) == "");
    }
}

TEST_CASE("CredentialCipher - Rejections", "[CredentialCipher]") {
    CredentialCipher cipher("operator-secret");
    const std::string sealed = cipher.encrypt("payload");

    SECTION("Wrong key fails authentication") {
        CredentialCipher other("another-secret");
        REQUIRE_THROWS_AS(other.decrypt(sealed), std::runtime_error);
    }

    SECTION("Tampered ciphertext fails authentication") {
        std::string tampered = sealed;
        tampered[tampered.size() / 2] = tampered[tampered.size() / 2] == 'A' ? 'B' : 'A';
        REQUIRE_THROWS(cipher.decrypt(tampered));
    }

    SECTION("Short input is malformed") {
        REQUIRE_THROWS_AS(cipher.decrypt("AAAA"), std::invalid_argument);
    }

    SECTION("Empty secret") {
        REQUIRE_THROWS_AS(CredentialCipher(""), std::invalid_argument);
    }
}
