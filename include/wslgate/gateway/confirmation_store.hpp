#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "wslgate/core/config.hpp"
#include "wslgate/core/error.hpp"
#include "wslgate/core/types.hpp"

namespace wslgate::gateway {

/// Holds dangerous commands between the execute call that parks them and
/// the confirm call that resumes them.
///
/// Tokens are single use: `consume` removes the entry whether the caller
/// goes on to approve or reject, and a second `consume` of the same token
/// fails with ErrorCode::InvalidConfirmation.
class ConfirmationStore {
public:
    virtual ~ConfirmationStore() = default;

    /// Stores `request` under a fresh token not currently in the store and
    /// returns that token.
    virtual auto park(ValidatedCommand request) -> std::string = 0;

    /// Atomically looks up and removes the entry for `token`.
    virtual auto consume(std::string_view token) -> Result<PendingConfirmation> = 0;

    [[nodiscard]] virtual auto size() const -> std::size_t = 0;
};

/// Process-local store. Guarded by a mutex so two threads can never both
/// consume the same token. Entries never expire.
class InMemoryConfirmationStore : public ConfirmationStore {
public:
    InMemoryConfirmationStore();
    explicit InMemoryConfirmationStore(ConfirmationConfig config);

    InMemoryConfirmationStore(const InMemoryConfirmationStore&) = delete;
    InMemoryConfirmationStore& operator=(const InMemoryConfirmationStore&) = delete;

    auto park(ValidatedCommand request) -> std::string override;
    auto consume(std::string_view token) -> Result<PendingConfirmation> override;
    [[nodiscard]] auto size() const -> std::size_t override;

    [[nodiscard]] auto contains(std::string_view token) const -> bool;

private:
    ConfirmationConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingConfirmation> pending_;
};

} // namespace wslgate::gateway
