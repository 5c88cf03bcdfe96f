#pragma once

#include "network/endpoint.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace lanlog::network {

/**
 * PeerRegistry - deduplicated, ordered view of discovered peers.
 *
 * Pure data structure; owned and mutated by RemoteLogger on the event loop.
 * Each identity keeps the sequence number of its first sighting, which breaks
 * ties between peers with equal names.
 */
class PeerRegistry {
public:
    // Returns true when the identity was not known before.
    bool upsert(const PeerInfo& peer);

    // Returns true when the identity was known.
    bool remove(const Endpoint& endpoint);

    // Replace the contents with `snapshot`. Known identities keep their order.
    void apply_snapshot(const std::vector<PeerInfo>& snapshot);

    void clear();

    // Sorted by case-insensitive display name, then discovery order.
    [[nodiscard]] std::vector<PeerInfo> list() const;

    [[nodiscard]] std::optional<PeerInfo> find(const Endpoint& endpoint) const;
    [[nodiscard]] bool contains(const Endpoint& endpoint) const;
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    struct Entry {
        PeerInfo peer;
        uint64_t sequence = 0;
    };

    std::vector<Entry>::iterator locate(const Endpoint& endpoint);
    std::vector<Entry>::const_iterator locate(const Endpoint& endpoint) const;

    std::vector<Entry> entries_;
    uint64_t next_sequence_ = 0;
};

} // namespace lanlog::network
