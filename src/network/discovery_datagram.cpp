#include "network/discovery_datagram.hpp"

#include <QJsonDocument>
#include <QJsonObject>

namespace lanlog::network {
namespace {

constexpr const char* kMsgType = "lanlog";
constexpr const char* kDefaultDomain = "local";

QJsonObject to_json(const ServiceInfo& info) {
    QJsonObject txt;
    for (const auto& [key, value] : info.txt) {
        txt[key] = value;
    }

    QJsonObject obj;
    obj["t"] = QString::fromLatin1(kMsgType);
    obj["v"] = kDatagramVersion;
    obj["name"] = info.name;
    obj["type"] = info.type;
    obj["port"] = static_cast<int>(info.port);
    obj["txt"] = txt;
    return obj;
}

} // namespace

QByteArray encode_discovery_datagram(const ServiceInfo& info) {
    return QJsonDocument(to_json(info)).toJson(QJsonDocument::Compact);
}

Result<PeerInfo, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                  const QHostAddress& sender) {
    const auto doc = QJsonDocument::fromJson(datagram);
    if (doc.isNull() || !doc.isObject()) {
        return Result<PeerInfo, Error>::err(Error{"invalid json"});
    }

    const auto obj = doc.object();
    if (obj["t"].toString() != QString::fromLatin1(kMsgType)) {
        return Result<PeerInfo, Error>::err(Error{"wrong message type"});
    }
    if (!obj.contains("name") || !obj.contains("port") || !obj.contains("v")) {
        return Result<PeerInfo, Error>::err(Error{"missing fields"});
    }
    if (obj["v"].toInt() != kDatagramVersion) {
        return Result<PeerInfo, Error>::err(Error{"unsupported version"});
    }

    const auto name = obj["name"].toString();
    if (name.isEmpty()) {
        return Result<PeerInfo, Error>::err(Error{"empty name"});
    }

    const int port_int = obj["port"].toInt();
    if (port_int <= 0 || port_int > 65535) {
        return Result<PeerInfo, Error>::err(Error{"invalid port"});
    }

    PeerInfo peer;
    peer.endpoint = ServiceEndpoint{name, obj["type"].toString(),
                                    QString::fromLatin1(kDefaultDomain)};
    peer.host = sender;
    peer.port = static_cast<uint16_t>(port_int);
    peer.last_seen = Timestamp::now();

    // Non-string TXT values are dropped, mirroring DNS-SD where every value is text.
    const auto txt_value = obj["txt"];
    if (txt_value.isObject()) {
        TxtRecord txt;
        const auto txt_obj = txt_value.toObject();
        for (auto it = txt_obj.begin(); it != txt_obj.end(); ++it) {
            if (it.value().isString()) {
                txt.emplace(it.key(), it.value().toString());
            }
        }
        peer.metadata = std::move(txt);
    }

    return Result<PeerInfo, Error>::ok(std::move(peer));
}

} // namespace lanlog::network
