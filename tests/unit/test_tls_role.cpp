#include <catch2/catch_test_macros.hpp>
#include "network/tls_role.hpp"

using namespace konnect::network;

TEST_CASE("TlsRole: greater device id is server", "[tls]") {
    REQUIRE(compute_tls_role("b_1", "a_9") == TlsRole::Server);
    REQUIRE(compute_tls_role("a_9", "b_1") == TlsRole::Client);
}

TEST_CASE("TlsRole: comparison is case-sensitive and bytewise", "[tls]") {
    // 'a' (0x61) sorts after 'Z' (0x5a).
    REQUIRE(compute_tls_role("abc", "Zzz") == TlsRole::Server);
    REQUIRE(compute_tls_role("Zzz", "abc") == TlsRole::Client);
    // A prefix sorts first.
    REQUIRE(compute_tls_role("abc_1", "abc") == TlsRole::Server);
    // '_' (0x5f) sorts after digits and upper case.
    REQUIRE(compute_tls_role("a_", "a9") == TlsRole::Server);
    REQUIRE(compute_tls_role("a_", "aZ") == TlsRole::Server);
}

TEST_CASE("TlsRole: names", "[tls]") {
    REQUIRE(std::string(tls_role_name(TlsRole::Server)) == "server");
    REQUIRE(std::string(tls_role_name(TlsRole::Client)) == "client");
}
