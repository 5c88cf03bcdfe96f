#include "network/peer_registry.hpp"

#include <algorithm>
#include <set>

namespace lanlog::network {

std::vector<PeerRegistry::Entry>::iterator PeerRegistry::locate(const Endpoint& endpoint) {
    return std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.peer.endpoint == endpoint; });
}

std::vector<PeerRegistry::Entry>::const_iterator PeerRegistry::locate(const Endpoint& endpoint) const {
    return std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.peer.endpoint == endpoint; });
}

bool PeerRegistry::upsert(const PeerInfo& peer) {
    auto it = locate(peer.endpoint);
    if (it != entries_.end()) {
        it->peer = peer;
        return false;
    }
    entries_.push_back(Entry{peer, next_sequence_++});
    return true;
}

bool PeerRegistry::remove(const Endpoint& endpoint) {
    auto it = locate(endpoint);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void PeerRegistry::apply_snapshot(const std::vector<PeerInfo>& snapshot) {
    std::set<Endpoint> live;
    for (const auto& peer : snapshot) {
        live.insert(peer.endpoint);
        upsert(peer);
    }

    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return live.count(e.peer.endpoint) == 0; }),
                   entries_.end());
}

void PeerRegistry::clear() {
    entries_.clear();
}

std::vector<PeerInfo> PeerRegistry::list() const {
    std::vector<const Entry*> sorted;
    sorted.reserve(entries_.size());
    for (const auto& entry : entries_) {
        sorted.push_back(&entry);
    }

    std::sort(sorted.begin(), sorted.end(), [](const Entry* a, const Entry* b) {
        const int cmp = QString::compare(display_name(a->peer), display_name(b->peer),
                                         Qt::CaseInsensitive);
        if (cmp != 0) {
            return cmp < 0;
        }
        return a->sequence < b->sequence;
    });

    std::vector<PeerInfo> result;
    result.reserve(sorted.size());
    for (const auto* entry : sorted) {
        result.push_back(entry->peer);
    }
    return result;
}

std::optional<PeerInfo> PeerRegistry::find(const Endpoint& endpoint) const {
    auto it = locate(endpoint);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->peer;
}

bool PeerRegistry::contains(const Endpoint& endpoint) const {
    return locate(endpoint) != entries_.end();
}

} // namespace lanlog::network
