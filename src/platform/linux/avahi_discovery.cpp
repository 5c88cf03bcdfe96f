#include "network/discovery.hpp"

#ifdef LANLOG_HAS_AVAHI

#include "core/logging.hpp"

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/thread-watch.h>

#include <QMetaObject>

#include <atomic>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace lanlog::network {

/**
 * Avahi-based mDNS/DNS-SD discovery backend for Linux.
 *
 * Avahi invokes its callbacks on the threaded-poll thread. Every event is
 * copied into plain Qt values there and replayed on the thread that owns the
 * backend, so DiscoveryBackend callbacks never run concurrently.
 *
 * A service can be seen on several interfaces and protocols at once; the
 * peer is only reported lost when its last sighting is removed.
 *
 * A client that reached AVAHI_CLIENT_FAILURE (daemon restarted or gone) is
 * replaced on the next start_browsing()/start_advertising(), and whatever
 * was browsed or advertised on it is set up again on the new one.
 */
class AvahiDiscoveryBackend : public DiscoveryBackend {
public:
    explicit AvahiDiscoveryBackend(QString service_type)
        : service_type_(std::move(service_type))
        , service_type_utf8_(service_type_.toUtf8())
    {}

    ~AvahiDiscoveryBackend() override {
        on_peer_lost = nullptr;
        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        stop_advertising();
        stop_browsing();

        if (client_) {
            avahi_client_free(client_);
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
        }
    }

    Result<void, DiscoveryError> start_advertising(const ServiceInfo& info) override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        auto published = publish(info);
        if (published.is_ok()) {
            advertised_ = info;
        }
        return published;
    }

    void stop_advertising() override {
        advertised_.reset();
        if (!entry_group_) return;
        PollLock lock(threaded_poll_);
        avahi_entry_group_reset(entry_group_);
        avahi_entry_group_free(entry_group_);
        entry_group_ = nullptr;
    }

    Result<void, DiscoveryError> start_browsing() override {
        auto client = ensure_client();
        if (client.is_err()) return client;
        return create_browser();
    }

    void stop_browsing() override {
        {
            PollLock lock(threaded_poll_);
            // Resolvers still in flight belong to this browse session.
            for (AvahiServiceResolver* resolver : resolvers_) {
                avahi_service_resolver_free(resolver);
            }
            resolvers_.clear();
            if (browser_) {
                avahi_service_browser_free(browser_);
                browser_ = nullptr;
            }
            ++generation_;
        }
        drop_sightings();
    }

private:
    using Sighting = std::pair<AvahiIfIndex, AvahiProtocol>;

    class PollLock {
    public:
        explicit PollLock(AvahiThreadedPoll* poll) : poll_(poll) {
            if (poll_) avahi_threaded_poll_lock(poll_);
        }
        ~PollLock() {
            if (poll_) avahi_threaded_poll_unlock(poll_);
        }
        PollLock(const PollLock&) = delete;
        PollLock& operator=(const PollLock&) = delete;

    private:
        AvahiThreadedPoll* poll_;
    };

    QString service_type_;
    QByteArray service_type_utf8_;

    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiEntryGroup* entry_group_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;

    // Guarded by the poll lock; Avahi callbacks run with it held.
    std::set<AvahiServiceResolver*> resolvers_;

    // Events posted from the poll thread carry the generation they were
    // produced in; anything older than the current browse session is dropped.
    std::atomic<uint64_t> generation_{0};

    // Owner-thread state only.
    std::map<Endpoint, std::set<Sighting>> sightings_;
    std::optional<ServiceInfo> advertised_;
    QObject dispatcher_;

    Result<void, DiscoveryError> publish(const ServiceInfo& info) {
        PollLock lock(threaded_poll_);
        if (entry_group_) {
            avahi_entry_group_reset(entry_group_);
        } else {
            entry_group_ = avahi_entry_group_new(client_, entry_group_callback, this);
        }
        if (!entry_group_) {
            return Result<void, DiscoveryError>::err(DiscoveryError{
                DiscoveryErrorKind::Failure, last_client_error("Failed to create entry group")});
        }

        AvahiStringList* txt = nullptr;
        for (const auto& [key, value] : info.txt) {
            txt = avahi_string_list_add_pair(txt, key.toUtf8().constData(),
                                             value.toUtf8().constData());
        }

        const auto type = info.type.isEmpty() ? service_type_utf8_ : info.type.toUtf8();
        int ret = avahi_entry_group_add_service_strlst(
            entry_group_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            static_cast<AvahiPublishFlags>(0),
            info.name.toUtf8().constData(),
            type.constData(),
            nullptr,  // domain
            nullptr,  // host
            info.port,
            txt
        );

        avahi_string_list_free(txt);

        if (ret < 0) {
            return Result<void, DiscoveryError>::err(DiscoveryError{
                DiscoveryErrorKind::Failure,
                QStringLiteral("Failed to add service: %1").arg(QString::fromUtf8(avahi_strerror(ret)))});
        }

        ret = avahi_entry_group_commit(entry_group_);
        if (ret < 0) {
            return Result<void, DiscoveryError>::err(DiscoveryError{
                DiscoveryErrorKind::Failure,
                QStringLiteral("Failed to commit service: %1").arg(QString::fromUtf8(avahi_strerror(ret)))});
        }

        return Result<void, DiscoveryError>::ok();
    }

    Result<void, DiscoveryError> create_browser() {
        PollLock lock(threaded_poll_);
        if (browser_) {
            return Result<void, DiscoveryError>::ok();
        }

        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            service_type_utf8_.constData(),
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );

        if (!browser_) {
            return Result<void, DiscoveryError>::err(DiscoveryError{
                DiscoveryErrorKind::Failure, last_client_error("Failed to create service browser")});
        }

        return Result<void, DiscoveryError>::ok();
    }

    void drop_sightings() {
        auto lost = std::move(sightings_);
        sightings_.clear();
        if (on_peer_lost) {
            for (const auto& [endpoint, where] : lost) {
                on_peer_lost(endpoint);
            }
        }
    }

    template <typename Fn>
    void post(Fn&& fn) {
        const uint64_t generation = generation_.load();
        QMetaObject::invokeMethod(&dispatcher_,
            [this, generation, fn = std::forward<Fn>(fn)]() mutable {
                if (generation != generation_.load()) return;
                fn();
            },
            Qt::QueuedConnection);
    }

    QString last_client_error(const char* what) const {
        const int err = client_ ? avahi_client_errno(client_) : AVAHI_ERR_FAILURE;
        return QStringLiteral("%1: %2").arg(QString::fromUtf8(what),
                                            QString::fromUtf8(avahi_strerror(err)));
    }

    static DiscoveryErrorKind classify(int avahi_error) {
        switch (avahi_error) {
            case AVAHI_ERR_ACCESS_DENIED:
            case AVAHI_ERR_NOT_PERMITTED:
                return DiscoveryErrorKind::PermissionDenied;
            case AVAHI_ERR_NO_DAEMON:
            case AVAHI_ERR_DISCONNECTED:
            case AVAHI_ERR_NO_NETWORK:
                return DiscoveryErrorKind::Unavailable;
            default:
                return DiscoveryErrorKind::Failure;
        }
    }

    AvahiClientState client_state() const {
        PollLock lock(threaded_poll_);
        return avahi_client_get_state(client_);
    }

    Result<void, DiscoveryError> ensure_client() {
        if (!client_) return create_client();
        if (client_state() != AVAHI_CLIENT_FAILURE) return Result<void, DiscoveryError>::ok();

        qCInfo(lcDiscovery) << "avahi: client failed earlier, reconnecting to the daemon";
        const bool was_browsing = browser_ != nullptr;
        free_client();
        if (was_browsing) {
            drop_sightings();
        }

        auto created = create_client();
        if (created.is_err()) return created;

        if (was_browsing) {
            auto browsing = create_browser();
            if (browsing.is_err()) return browsing;
        }
        if (advertised_) {
            auto published = publish(*advertised_);
            if (published.is_err()) {
                qCWarning(lcDiscovery) << "avahi: cannot re-advertise" << advertised_->name
                                       << describe(published.unwrap_err());
            }
        }
        return Result<void, DiscoveryError>::ok();
    }

    // Freeing the client also frees its browser, resolvers and entry group.
    void free_client() {
        avahi_threaded_poll_stop(threaded_poll_);
        browser_ = nullptr;
        entry_group_ = nullptr;
        resolvers_.clear();
        avahi_client_free(client_);
        client_ = nullptr;
        avahi_threaded_poll_free(threaded_poll_);
        threaded_poll_ = nullptr;
        ++generation_;
    }

    Result<void, DiscoveryError> create_client() {
        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, DiscoveryError>::err(DiscoveryError{
                DiscoveryErrorKind::Failure, QStringLiteral("Failed to create Avahi poll")});
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, DiscoveryError>::err(DiscoveryError{
                classify(error),
                QStringLiteral("Failed to create Avahi client: %1")
                    .arg(QString::fromUtf8(avahi_strerror(error)))});
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, DiscoveryError>::err(DiscoveryError{
                DiscoveryErrorKind::Failure, QStringLiteral("Failed to start Avahi poll thread")});
        }

        return Result<void, DiscoveryError>::ok();
    }

    void handle_resolved(Sighting where, PeerInfo info) {
        auto& seen = sightings_[info.endpoint];
        const bool is_new = seen.empty();
        seen.insert(where);

        if (is_new) {
            if (on_peer_discovered) on_peer_discovered(std::move(info));
        } else {
            if (on_peer_updated) on_peer_updated(std::move(info));
        }
    }

    void handle_removed(Sighting where, const Endpoint& endpoint) {
        auto it = sightings_.find(endpoint);
        if (it == sightings_.end()) return;

        it->second.erase(where);
        if (it->second.empty()) {
            sightings_.erase(it);
            if (on_peer_lost) on_peer_lost(endpoint);
        }
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (state) {
            case AVAHI_CLIENT_FAILURE: {
                const int err = avahi_client_errno(client);
                DiscoveryError error{classify(err),
                    QStringLiteral("Avahi client failure: %1").arg(QString::fromUtf8(avahi_strerror(err)))};
                self->post([self, error]() {
                    if (self->on_error) self->on_error(error);
                });
                break;
            }
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
            case AVAHI_CLIENT_S_RUNNING:
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    static void entry_group_callback(AvahiEntryGroup* group,
                                     AvahiEntryGroupState state,
                                     void* userdata) {
        Q_UNUSED(group);
        Q_UNUSED(userdata);

        switch (state) {
            case AVAHI_ENTRY_GROUP_ESTABLISHED:
                qCInfo(lcDiscovery) << "avahi: service registered";
                break;
            case AVAHI_ENTRY_GROUP_COLLISION:
                qCWarning(lcDiscovery) << "avahi: service name collision";
                break;
            case AVAHI_ENTRY_GROUP_FAILURE:
                qCWarning(lcDiscovery) << "avahi: service registration failed";
                break;
            case AVAHI_ENTRY_GROUP_UNCOMMITED:
            case AVAHI_ENTRY_GROUP_REGISTERING:
                break;
        }
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags flags,
                                void* userdata) {
        Q_UNUSED(flags);
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                AvahiServiceResolver* resolver = avahi_service_resolver_new(
                        self->client_,
                        interface,
                        protocol,
                        name,
                        type,
                        domain,
                        AVAHI_PROTO_UNSPEC,
                        static_cast<AvahiLookupFlags>(0),
                        resolve_callback,
                        userdata);
                if (resolver) {
                    self->resolvers_.insert(resolver);
                } else {
                    qCWarning(lcDiscovery) << "avahi: cannot resolve" << name
                                           << avahi_strerror(avahi_client_errno(self->client_));
                }
                break;
            }

            case AVAHI_BROWSER_REMOVE: {
                const Endpoint endpoint = ServiceEndpoint{QString::fromUtf8(name),
                                                          QString::fromUtf8(type),
                                                          QString::fromUtf8(domain)};
                const Sighting where{interface, protocol};
                self->post([self, where, endpoint]() {
                    self->handle_removed(where, endpoint);
                });
                break;
            }

            case AVAHI_BROWSER_FAILURE: {
                const int err = avahi_client_errno(avahi_service_browser_get_client(browser));
                DiscoveryError error{classify(err),
                    QStringLiteral("Service browser failed: %1").arg(QString::fromUtf8(avahi_strerror(err)))};
                self->post([self, error]() {
                    if (self->on_error) self->on_error(error);
                });
                break;
            }

            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex interface,
                                 AvahiProtocol protocol,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char* type,
                                 const char* domain,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags flags,
                                 void* userdata) {
        Q_UNUSED(host_name);
        Q_UNUSED(flags);
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        if (event == AVAHI_RESOLVER_FOUND) {
            PeerInfo info;
            info.endpoint = ServiceEndpoint{QString::fromUtf8(name),
                                            QString::fromUtf8(type),
                                            QString::fromUtf8(domain)};
            info.port = port;
            info.last_seen = Timestamp::now();

            char addr_str[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(addr_str, sizeof(addr_str), address);
            info.host = QHostAddress(QString::fromUtf8(addr_str));

            TxtRecord record;
            for (AvahiStringList* item = txt; item; item = item->next) {
                char* key = nullptr;
                char* value = nullptr;
                if (avahi_string_list_get_pair(item, &key, &value, nullptr) == 0) {
                    record[QString::fromUtf8(key)] =
                        value ? QString::fromUtf8(value) : QString();
                    avahi_free(key);
                    avahi_free(value);
                }
            }
            info.metadata = std::move(record);

            const Sighting where{interface, protocol};
            self->post([self, where, info = std::move(info)]() mutable {
                self->handle_resolved(where, std::move(info));
            });
        } else {
            qCDebug(lcDiscovery) << "avahi: resolve failed for" << name
                                 << avahi_strerror(avahi_client_errno(self->client_));
        }

        self->resolvers_.erase(resolver);
        avahi_service_resolver_free(resolver);
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBackend(const QString& service_type) {
    return std::make_unique<AvahiDiscoveryBackend>(service_type);
}

} // namespace lanlog::network

#endif // LANLOG_HAS_AVAHI
