#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "errors.hpp"
#include "object_store.hpp"

namespace mediacache {

/**
 * ConnectionManager - owns the single live handle to the remote store.
 *
 * The handle is created lazily by the injected factory. When an operation
 * fails with RemoteErrorKind::kAuthExpired the handle is discarded, a new one
 * is built, reset listeners run, and the operation is retried once. A second
 * authentication failure surfaces as RemoteUnavailableError. Transient
 * failures (timeouts, unavailable) surface as RemoteUnavailableError without a
 * reset. Not-found and permission errors propagate unchanged.
 *
 * The handle is swapped as a whole under the mutex; callers keep their own
 * shared_ptr for the duration of a call, so they see either the old or the
 * new handle, never a mix.
 */
class ConnectionManager {
public:
    using ClientFactory = std::function<std::shared_ptr<IObjectStore>()>;
    using ResetListener = std::function<void()>;

    struct Status {
        bool connected = false;
        std::string location;
        std::uint64_t handles_created = 0;
        std::uint64_t resets = 0;
        bool credential_expiry_observed = false;
    };

    explicit ConnectionManager(ClientFactory factory, bool debug_mode = false);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Run fn against the current handle, with one reconnect-and-retry on
     * authentication expiry.
     *
     * @param fn Callable taking IObjectStore&
     * @return Whatever fn returns
     * @throws RemoteUnavailableError on transient failure or repeated auth failure
     * @throws RemoteError for not-found, permission and other failures
     */
    template <typename Fn>
    auto withConnection(Fn&& fn) -> decltype(fn(std::declval<IObjectStore&>()));

    // Drop the current handle; the next call builds a fresh one
    void forceReset();

    // Called after every reset, outside the manager's lock.
    // Returns an id for removeResetListener.
    std::size_t addResetListener(ResetListener listener);
    void removeResetListener(std::size_t id);

    Status status() const;

private:
    std::shared_ptr<IObjectStore> acquire();
    std::shared_ptr<IObjectStore> replaceAfterAuthFailure(const std::shared_ptr<IObjectStore>& failed);
    std::shared_ptr<IObjectStore> createLocked();
    void notifyReset();

    [[noreturn]] void raiseUnavailable(const RemoteError& error, bool after_reset);

    ClientFactory factory_;
    bool debug_mode_;

    mutable std::mutex mutex_;
    std::shared_ptr<IObjectStore> client_;
    std::uint64_t handles_created_ = 0;
    std::uint64_t resets_ = 0;
    bool credential_expiry_observed_ = false;

    std::mutex listeners_mutex_;
    std::map<std::size_t, ResetListener> listeners_;
    std::size_t next_listener_id_ = 0;
};

template <typename Fn>
auto ConnectionManager::withConnection(Fn&& fn) -> decltype(fn(std::declval<IObjectStore&>()))
{
    std::shared_ptr<IObjectStore> client = acquire();
    try {
        return fn(*client);
    } catch (const RemoteError& e) {
        if (e.kind() == RemoteErrorKind::kTransient) {
            raiseUnavailable(e, false);
        }
        if (e.kind() != RemoteErrorKind::kAuthExpired) {
            throw;
        }
        std::cerr << "[WARN] Authentication expired, rebuilding connection: " << e.what() << std::endl;
    }

    client = replaceAfterAuthFailure(client);
    try {
        return fn(*client);
    } catch (const RemoteError& e) {
        if (e.kind() == RemoteErrorKind::kTransient || e.kind() == RemoteErrorKind::kAuthExpired) {
            raiseUnavailable(e, true);
        }
        throw;
    }
}

} // namespace mediacache
