#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "network/peer_registry.hpp"

#include <algorithm>
#include <map>
#include <set>

using namespace lanlog::network;

namespace {

struct RegistryOp {
    bool remove = false;
    std::string name;
    std::string protected_value;
};

PeerInfo peer_for(const RegistryOp& op) {
    PeerInfo peer;
    if (op.name.empty()) {
        peer.endpoint = HostPortEndpoint{QStringLiteral("10.0.0.1"), 4000};
    } else {
        peer.endpoint = ServiceEndpoint{QString::fromStdString(op.name),
                                        QStringLiteral("_lanlog._tcp"), QStringLiteral("local")};
    }
    peer.metadata = TxtRecord{{QStringLiteral("protected"),
                               QString::fromStdString(op.protected_value)}};
    return peer;
}

} // namespace

namespace rc {

// Small alphabet so names collide and differ only in case.
template<>
struct Arbitrary<RegistryOp> {
    static Gen<RegistryOp> arbitrary() {
        return gen::build<RegistryOp>(
            gen::set(&RegistryOp::remove, gen::weightedElement<bool>({{1, true}, {3, false}})),
            gen::set(&RegistryOp::name,
                     gen::container<std::string>(gen::elementOf(std::string("aAbB")))),
            gen::set(&RegistryOp::protected_value,
                     gen::elementOf(std::vector<std::string>{"true", "false", "True", "1", ""})));
    }
};

} // namespace rc

TEST_CASE("Property: registry list is sorted by display name", "[property][registry]") {
    rc::check("list() is ordered case-insensitively",
        [](const std::vector<RegistryOp>& ops) {
            PeerRegistry registry;
            for (const auto& op : ops) {
                if (op.remove) {
                    registry.remove(peer_for(op).endpoint);
                } else {
                    registry.upsert(peer_for(op));
                }
            }

            const auto list = registry.list();
            for (std::size_t i = 1; i < list.size(); ++i) {
                RC_ASSERT(QString::compare(display_name(list[i - 1]), display_name(list[i]),
                                           Qt::CaseInsensitive) <= 0);
            }
        });
}

TEST_CASE("Property: registry holds each identity once", "[property][registry]") {
    rc::check("list() matches the set of live identities",
        [](const std::vector<RegistryOp>& ops) {
            PeerRegistry registry;
            std::set<Endpoint> model;
            for (const auto& op : ops) {
                const auto peer = peer_for(op);
                if (op.remove) {
                    RC_ASSERT(registry.remove(peer.endpoint) == (model.erase(peer.endpoint) == 1));
                } else {
                    RC_ASSERT(registry.upsert(peer) == model.insert(peer.endpoint).second);
                }
            }

            const auto list = registry.list();
            RC_ASSERT(list.size() == model.size());
            std::set<Endpoint> seen;
            for (const auto& peer : list) {
                RC_ASSERT(seen.insert(peer.endpoint).second);
                RC_ASSERT(model.count(peer.endpoint) == 1u);
            }
        });
}

TEST_CASE("Property: last upsert wins for metadata", "[property][registry]") {
    rc::check("find() returns the most recent attributes",
        [](const std::vector<RegistryOp>& ops) {
            PeerRegistry registry;
            std::map<Endpoint, bool> expected;
            for (const auto& op : ops) {
                const auto peer = peer_for(op);
                if (op.remove) {
                    registry.remove(peer.endpoint);
                    expected.erase(peer.endpoint);
                } else {
                    registry.upsert(peer);
                    expected[peer.endpoint] = op.protected_value == "true";
                }
            }

            for (const auto& [endpoint, isProtected] : expected) {
                const auto found = registry.find(endpoint);
                RC_ASSERT(found.has_value());
                RC_ASSERT(found->isProtected() == isProtected);
            }
        });
}

TEST_CASE("Property: protected flag is true only for the literal", "[property][endpoint]") {
    rc::check("is_protected(txt) == (value == \"true\")",
        [](const std::string& value) {
            const Metadata metadata = TxtRecord{{QStringLiteral("protected"),
                                                 QString::fromStdString(value)}};
            RC_ASSERT(is_protected(metadata) == (value == "true"));
        });
}
