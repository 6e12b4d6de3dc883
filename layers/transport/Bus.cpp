#include "Bus.h"

namespace transport {

Bus::Bus(ITransport& transport)
    : transport_(transport),
      multiplexed_(transport.connectionType() == ConnectionType::Tcp) {}

std::unique_lock<std::timed_mutex> Bus::claim(const std::function<bool()>& stopRequested) {
    std::unique_lock<std::timed_mutex> lock(wireMutex_, std::defer_lock);
    while (!stopRequested()) {
        if (lock.try_lock_for(std::chrono::milliseconds(20))) {
            break;
        }
    }
    return lock;
}

std::unique_lock<std::mutex> Bus::tryClaimReader() {
    return std::unique_lock<std::mutex>(readerMutex_, std::try_to_lock);
}

bool Bus::route(std::uint16_t transactionId, std::vector<std::uint8_t> frame) {
    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        auto it = inbox_.find(transactionId);
        if (it == inbox_.end()) {
            return false;
        }
        it->second.push_back(std::move(frame));
    }
    inboxCv_.notify_all();
    return true;
}

Bus::Mailbox::Mailbox(Bus& bus, std::uint16_t transactionId) : bus_(bus), transactionId_(transactionId) {
    std::lock_guard<std::mutex> lock(bus_.inboxMutex_);
    bus_.inbox_[transactionId_].clear();
}

Bus::Mailbox::~Mailbox() {
    std::lock_guard<std::mutex> lock(bus_.inboxMutex_);
    bus_.inbox_.erase(transactionId_);
}

std::optional<std::vector<std::uint8_t>> Bus::Mailbox::take(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(bus_.inboxMutex_);
    auto& frames = bus_.inbox_[transactionId_];
    if (!bus_.inboxCv_.wait_for(lock, timeout, [&frames] { return !frames.empty(); })) {
        return std::nullopt;
    }
    auto frame = std::move(frames.front());
    frames.pop_front();
    return frame;
}

} // namespace transport
