#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/identity.hpp"
#include "network/tls_role.hpp"

#include <string>

using namespace konnect;
using namespace konnect::network;

namespace {

rc::Gen<QString> genDeviceId() {
    return rc::gen::map(
        rc::gen::resize(38, rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::elementOf(
            std::string("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-"))))),
        [](const std::string& id) { return QString::fromStdString(id.substr(0, 38)); });
}

} // namespace

TEST_CASE("Property: exactly one side of a connection is the TLS server", "[property][tls]") {
    rc::check("roles computed from each end are complementary",
        []() {
            const QString a = *genDeviceId();
            const QString b = *genDeviceId();
            RC_PRE(a != b);
            RC_ASSERT(is_valid_device_id(a));
            RC_ASSERT(is_valid_device_id(b));

            const TlsRole from_a = compute_tls_role(a, b);
            const TlsRole from_b = compute_tls_role(b, a);
            RC_ASSERT(from_a != from_b);
            RC_ASSERT((from_a == TlsRole::Server) == (a > b));
        });
}

TEST_CASE("Property: the role does not depend on who dials", "[property][tls]") {
    rc::check("role is a function of the two ids only",
        []() {
            const QString a = *genDeviceId();
            const QString b = *genDeviceId();
            RC_PRE(a != b);
            RC_ASSERT(compute_tls_role(a, b) == compute_tls_role(QString(a), QString(b)));
        });
}
