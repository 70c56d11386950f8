#pragma once

#include "bacnet_codec.h"
#include "bacnet_types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace bacproxy {

// Receives I-Am announcements while a discovery window is open.
class AnnouncementListener {
  public:
    virtual ~AnnouncementListener() = default;

    virtual void onAnnouncement(const Ipv4Endpoint &source, const codec::IAm &iam) = 0;
    // The proxy is going away; the listener must stop waiting.
    virtual void onStopped() = 0;
};

/**
 * Pending confirmed requests, keyed by (peer, invoke id), plus the single
 * discovery listener slot.
 *
 * The worker thread routes replies in through deliver()/announce(); caller
 * threads register through open()/attach() and block in Pending::wait().
 * Once close() ran every registration fails with ProxyStopped.
 */
class ExchangeTable {
    struct Key {
        Ipv4Endpoint peer;
        std::uint8_t invokeId{0};

        bool operator<(const Key &other) const {
            return peer != other.peer ? peer < other.peer : invokeId < other.invokeId;
        }
    };

    struct Slot {
        codec::ConfirmedService service{codec::ConfirmedService::ReadProperty};
        std::optional<codec::Message> reply;
        bool stopped{false};
        std::condition_variable cv;
    };

  public:
    // Deregisters itself on destruction.
    class Pending {
      public:
        ~Pending();

        Pending(const Pending &) = delete;
        Pending &operator=(const Pending &) = delete;

        [[nodiscard]] std::uint8_t invokeId() const noexcept { return key.invokeId; }
        [[nodiscard]] const Ipv4Endpoint &peer() const noexcept { return key.peer; }

        // Reply, Timeout, or ProxyStopped.
        Result<codec::Message> wait(std::chrono::milliseconds timeout);

      private:
        friend class ExchangeTable;
        Pending(ExchangeTable &table, Key key, std::shared_ptr<Slot> slot);

        ExchangeTable &table;
        Key key;
        std::shared_ptr<Slot> slot;
    };

    class ListenerRegistration {
      public:
        ~ListenerRegistration();

        ListenerRegistration(const ListenerRegistration &) = delete;
        ListenerRegistration &operator=(const ListenerRegistration &) = delete;

      private:
        friend class ExchangeTable;
        ListenerRegistration(ExchangeTable &table, std::shared_ptr<AnnouncementListener> listener);

        ExchangeTable &table;
        std::shared_ptr<AnnouncementListener> listener;
    };

    ExchangeTable() = default;
    ExchangeTable(const ExchangeTable &) = delete;
    ExchangeTable &operator=(const ExchangeTable &) = delete;

    // Reserves a fresh invoke id towards `peer` and registers a waiter for it.
    Result<std::unique_ptr<Pending>> open(const Ipv4Endpoint &peer, codec::ConfirmedService service);

    // Routes a reply to its waiter. False when nothing matches (unknown key,
    // already answered, or a reply for a different service).
    bool deliver(const Ipv4Endpoint &peer, const codec::Message &reply);

    Result<std::unique_ptr<ListenerRegistration>> attach(std::shared_ptr<AnnouncementListener> listener);

    // False when no discovery window is open.
    bool announce(const Ipv4Endpoint &source, const codec::IAm &iam);

    // Releases every waiter and the open listener with ProxyStopped.
    void close();

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] bool listenerAttached() const;

  private:
    void release(const Key &key);
    void detach(const std::shared_ptr<AnnouncementListener> &listener);

    mutable std::mutex mtx;
    std::map<Key, std::shared_ptr<Slot>> pending;
    std::shared_ptr<AnnouncementListener> listener;
    std::uint8_t nextInvokeId{0};
    bool closed{false};
};

} // namespace bacproxy
