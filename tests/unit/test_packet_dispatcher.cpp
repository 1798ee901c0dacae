#include <catch2/catch_test_macros.hpp>
#include "network/packet_dispatcher.hpp"

#include <vector>

using namespace konnect;
using namespace konnect::network;

namespace {

Packet packet_of(const QString& type) {
    return PacketBuilder(type).build().unwrap();
}

} // namespace

TEST_CASE("PacketDispatcher: routes by type", "[dispatcher]") {
    PacketDispatcher dispatcher;
    std::vector<QString> seen;

    dispatcher.registerHandler("kdeconnect.ping", [&](const QString& device_id, const Packet& packet) {
        seen.push_back(device_id + "/" + packet.type());
    });
    dispatcher.registerHandler("kdeconnect.battery", [&](const QString& device_id, const Packet&) {
        seen.push_back(device_id + "/battery");
    });

    REQUIRE(dispatcher.handles("kdeconnect.ping"));
    REQUIRE_FALSE(dispatcher.handles("kdeconnect.share.request"));
    REQUIRE(dispatcher.types() == QSet<QString>{"kdeconnect.ping", "kdeconnect.battery"});

    REQUIRE(dispatcher.dispatch("b_1", packet_of("kdeconnect.ping")) == 1);
    REQUIRE(dispatcher.dispatch("b_1", packet_of("kdeconnect.share.request")) == 0);
    REQUIRE(seen == std::vector<QString>{"b_1/kdeconnect.ping"});
}

TEST_CASE("PacketDispatcher: registration order and removal", "[dispatcher]") {
    PacketDispatcher dispatcher;
    std::vector<int> order;

    const auto first = dispatcher.registerHandler("t", [&](const QString&, const Packet&) { order.push_back(1); });
    dispatcher.registerHandler("t", [&](const QString&, const Packet&) { order.push_back(2); });

    REQUIRE(dispatcher.dispatch("b_1", packet_of("t")) == 2);
    REQUIRE(order == std::vector<int>{1, 2});

    REQUIRE(dispatcher.unregisterHandler(first));
    REQUIRE_FALSE(dispatcher.unregisterHandler(first));
    order.clear();
    REQUIRE(dispatcher.dispatch("b_1", packet_of("t")) == 1);
    REQUIRE(order == std::vector<int>{2});
}

TEST_CASE("PacketDispatcher: handlers may re-enter", "[dispatcher]") {
    PacketDispatcher dispatcher;
    int late_calls = 0;

    dispatcher.registerHandler("t", [&](const QString&, const Packet&) {
        dispatcher.registerHandler("t", [&](const QString&, const Packet&) { ++late_calls; });
    });

    REQUIRE(dispatcher.dispatch("b_1", packet_of("t")) == 1);
    REQUIRE(late_calls == 0);
    dispatcher.dispatch("b_1", packet_of("t"));
    REQUIRE(late_calls == 1);
}
