#include "network/discovery_datagram.hpp"

namespace konnect::network {

Res<QByteArray> encode_discovery_datagram(const Identity& local) {
    if (local.tcp_port == 0) {
        return fail<QByteArray>(ErrorCode::InvalidState, "identity has no tcp port to announce");
    }
    auto packet = make_identity_packet(local);
    if (packet.is_err()) return Res<QByteArray>::err(packet.unwrap_err());
    return Res<QByteArray>::ok(encode_packet(packet.unwrap()));
}

Res<Identity> decode_discovery_datagram(const QByteArray& datagram, qsizetype max_size) {
    if (datagram.size() > max_size) {
        return fail<Identity>(ErrorCode::Codec, "datagram exceeds " + std::to_string(max_size) + " bytes");
    }

    // Some peers omit the terminator on UDP; a datagram is always one whole frame.
    QByteArray frame = datagram;
    if (!frame.endsWith('\n')) frame.append('\n');

    auto packet = decode_packet(frame);
    if (packet.is_err()) return Res<Identity>::err(packet.unwrap_err());

    auto identity = parse_identity_packet(packet.unwrap());
    if (identity.is_err()) return identity;
    if (identity.unwrap().tcp_port == 0) {
        return fail<Identity>(ErrorCode::Codec, "announcement without tcpPort");
    }
    return identity;
}

} // namespace konnect::network
