#include "exchange_table.h"

#include <type_traits>
#include <utility>

namespace bacproxy {

namespace {

bool replyMatchesService(const codec::Message &reply, codec::ConfirmedService service) {
    const auto expected = static_cast<std::uint8_t>(service);
    return std::visit(
        [expected, service](const auto &m) {
            using M = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<M, codec::ReadPropertyAck>) {
                return service == codec::ConfirmedService::ReadProperty;
            } else if constexpr (std::is_same_v<M, codec::SimpleAck>) {
                return m.service == expected && service == codec::ConfirmedService::WriteProperty;
            } else if constexpr (std::is_same_v<M, codec::FailureReply>) {
                return !m.service || *m.service == expected;
            } else {
                return false;
            }
        },
        reply);
}

} // namespace

ExchangeTable::Pending::Pending(ExchangeTable &table, Key key, std::shared_ptr<Slot> slot)
    : table(table), key(key), slot(std::move(slot)) {}

ExchangeTable::Pending::~Pending() {
    table.release(key);
}

Result<codec::Message> ExchangeTable::Pending::wait(std::chrono::milliseconds timeout) {
    std::unique_lock lock(table.mtx);
    slot->cv.wait_for(lock, timeout, [this]() { return slot->reply.has_value() || slot->stopped; });
    if (slot->reply) {
        return *slot->reply;
    }
    if (slot->stopped) {
        return makeError(ErrorKind::ProxyStopped, "proxy stopped while waiting for a reply");
    }
    return makeError(ErrorKind::Timeout, "no reply from " + formatDeviceAddress(key.peer) + " within " +
                                             std::to_string(timeout.count()) + " ms");
}

ExchangeTable::ListenerRegistration::ListenerRegistration(ExchangeTable &table,
                                                          std::shared_ptr<AnnouncementListener> listener)
    : table(table), listener(std::move(listener)) {}

ExchangeTable::ListenerRegistration::~ListenerRegistration() {
    table.detach(listener);
}

Result<std::unique_ptr<ExchangeTable::Pending>> ExchangeTable::open(const Ipv4Endpoint &peer,
                                                                    codec::ConfirmedService service) {
    std::lock_guard lock(mtx);
    if (closed) {
        return makeError(ErrorKind::ProxyStopped, "proxy is shutting down");
    }
    for (int attempt = 0; attempt < 256; ++attempt) {
        Key key{peer, nextInvokeId++};
        if (pending.count(key) != 0) {
            continue;
        }
        auto slot = std::make_shared<Slot>();
        slot->service = service;
        pending.emplace(key, slot);
        return std::unique_ptr<Pending>(new Pending(*this, key, std::move(slot)));
    }
    return makeError(ErrorKind::TransportError,
                     "all 256 invoke ids towards " + formatDeviceAddress(peer) + " are in flight");
}

bool ExchangeTable::deliver(const Ipv4Endpoint &peer, const codec::Message &reply) {
    const auto invokeId = codec::invokeIdOf(reply);
    if (!invokeId) {
        return false;
    }
    std::lock_guard lock(mtx);
    auto it = pending.find(Key{peer, *invokeId});
    if (it == pending.end()) {
        return false;
    }
    auto &slot = *it->second;
    if (slot.reply || slot.stopped || !replyMatchesService(reply, slot.service)) {
        return false;
    }
    slot.reply = reply;
    slot.cv.notify_all();
    return true;
}

Result<std::unique_ptr<ExchangeTable::ListenerRegistration>>
ExchangeTable::attach(std::shared_ptr<AnnouncementListener> newListener) {
    std::lock_guard lock(mtx);
    if (closed) {
        return makeError(ErrorKind::ProxyStopped, "proxy is shutting down");
    }
    if (listener) {
        return makeError(ErrorKind::InvalidRequest, "a discovery window is already open");
    }
    listener = newListener;
    return std::unique_ptr<ListenerRegistration>(new ListenerRegistration(*this, std::move(newListener)));
}

bool ExchangeTable::announce(const Ipv4Endpoint &source, const codec::IAm &iam) {
    std::shared_ptr<AnnouncementListener> target;
    {
        std::lock_guard lock(mtx);
        target = listener;
    }
    if (!target) {
        return false;
    }
    target->onAnnouncement(source, iam);
    return true;
}

void ExchangeTable::close() {
    std::shared_ptr<AnnouncementListener> open;
    {
        std::lock_guard lock(mtx);
        closed = true;
        for (auto &[key, slot] : pending) {
            slot->stopped = true;
            slot->cv.notify_all();
        }
        open = listener;
    }
    if (open) {
        open->onStopped();
    }
}

bool ExchangeTable::isClosed() const {
    std::lock_guard lock(mtx);
    return closed;
}

std::size_t ExchangeTable::pendingCount() const {
    std::lock_guard lock(mtx);
    return pending.size();
}

bool ExchangeTable::listenerAttached() const {
    std::lock_guard lock(mtx);
    return listener != nullptr;
}

void ExchangeTable::release(const Key &key) {
    std::lock_guard lock(mtx);
    pending.erase(key);
}

void ExchangeTable::detach(const std::shared_ptr<AnnouncementListener> &expected) {
    std::lock_guard lock(mtx);
    if (listener == expected) {
        listener.reset();
    }
}

} // namespace bacproxy
