#include "connection_manager.hpp"
#include <vector>

namespace mediacache {

ConnectionManager::ConnectionManager(ClientFactory factory, bool debug_mode)
    : factory_(std::move(factory)),
      debug_mode_(debug_mode)
{
    if (!factory_) {
        throw std::invalid_argument("ConnectionManager requires a client factory");
    }
}

std::shared_ptr<IObjectStore> ConnectionManager::createLocked()
{
    std::shared_ptr<IObjectStore> client;
    try {
        client = factory_();
    } catch (const MediaCacheError&) {
        throw;
    } catch (const std::exception& e) {
        throw RemoteUnavailableError(std::string("Failed to create remote connection: ") + e.what());
    }
    if (!client) {
        throw RemoteUnavailableError("Client factory returned no connection");
    }

    ++handles_created_;
    if (debug_mode_) {
        std::cout << "[DEBUG] Created remote connection #" << handles_created_
                  << " for " << client->location() << std::endl;
    }
    return client;
}

std::shared_ptr<IObjectStore> ConnectionManager::acquire()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        client_ = createLocked();
    }
    return client_;
}

std::shared_ptr<IObjectStore> ConnectionManager::replaceAfterAuthFailure(
    const std::shared_ptr<IObjectStore>& failed)
{
    bool replaced = false;
    std::shared_ptr<IObjectStore> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credential_expiry_observed_ = true;

        // Another request may already have swapped the handle
        if (!client_ || client_ == failed) {
            client_.reset();
            client_ = createLocked();
            ++resets_;
            replaced = true;
        }
        current = client_;
    }

    if (replaced) {
        std::cout << "Remote connection rebuilt after credential expiry" << std::endl;
        notifyReset();
    }
    return current;
}

void ConnectionManager::forceReset()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_.reset();
        ++resets_;
    }
    std::cout << "Remote connection reset on request" << std::endl;
    notifyReset();
}

std::size_t ConnectionManager::addResetListener(ResetListener listener)
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    std::size_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ConnectionManager::removeResetListener(std::size_t id)
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void ConnectionManager::notifyReset()
{
    std::vector<ResetListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        listener();
    }
}

ConnectionManager::Status ConnectionManager::status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Status status;
    status.connected = client_ != nullptr;
    status.location = client_ ? client_->location() : "";
    status.handles_created = handles_created_;
    status.resets = resets_;
    status.credential_expiry_observed = credential_expiry_observed_;
    return status;
}

void ConnectionManager::raiseUnavailable(const RemoteError& error, bool after_reset)
{
    std::string message;
    if (error.kind() == RemoteErrorKind::kAuthExpired) {
        message = "Authentication failed again after reconnect: ";
    } else if (after_reset) {
        message = "Remote unavailable after reconnect: ";
    } else {
        message = "Remote unavailable: ";
    }
    std::cerr << "Error: " << message << error.what() << std::endl;
    throw RemoteUnavailableError(message + error.what());
}

} // namespace mediacache
