#include "wslgate/gateway/confirmation_store.hpp"

#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"

namespace wslgate::gateway {

InMemoryConfirmationStore::InMemoryConfirmationStore()
    : InMemoryConfirmationStore(ConfirmationConfig{}) {}

InMemoryConfirmationStore::InMemoryConfirmationStore(ConfirmationConfig config)
    : config_(config) {
    if (config_.token_length < kMinTokenLength) {
        LOG_WARN("Confirmation token length {} is too short, using {}",
                 config_.token_length, kMinTokenLength);
        config_.token_length = kMinTokenLength;
    }
}

auto InMemoryConfirmationStore::park(ValidatedCommand request) -> std::string {
    std::lock_guard lock(mutex_);

    std::string token;
    do {
        token = utils::generate_id(config_.token_length);
    } while (pending_.contains(token));

    LOG_INFO("Parked dangerous command '{}' under confirmation {}",
             request.command.str(), token);

    pending_.emplace(token, PendingConfirmation{
        .token = token,
        .request = std::move(request),
        .created_at_ms = utils::timestamp_ms(),
    });

    auto threshold = config_.pending_warn_threshold;
    if (threshold > 0 && pending_.size() % threshold == 0) {
        LOG_WARN("{} confirmations pending; unconfirmed entries are never evicted",
                 pending_.size());
    }
    return token;
}

auto InMemoryConfirmationStore::consume(std::string_view token)
    -> Result<PendingConfirmation> {
    std::lock_guard lock(mutex_);

    auto it = pending_.find(std::string(token));
    if (it == pending_.end()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfirmation,
            "Invalid or expired confirmation ID", std::string(token)));
    }

    auto entry = std::move(it->second);
    pending_.erase(it);
    LOG_DEBUG("Consumed confirmation {} ({} still pending)", entry.token, pending_.size());
    return entry;
}

auto InMemoryConfirmationStore::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

auto InMemoryConfirmationStore::contains(std::string_view token) const -> bool {
    std::lock_guard lock(mutex_);
    return pending_.contains(std::string(token));
}

} // namespace wslgate::gateway
