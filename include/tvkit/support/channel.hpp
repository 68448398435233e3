//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/support/channel.hpp
// Purpose: Multi-producer, single-consumer message channel used to hand
//          decoded input and rendered output across the transport/UI thread
//          boundary of a remote session.
// Key invariants:
//   - Messages are received in send order.
//   - The channel is disconnected once every Sender has been closed or
//     destroyed; queued messages are still delivered before Disconnected is
//     reported.
//   - Sending after the Receiver is gone fails instead of queueing.
// Ownership/Lifetime: Shared state is reference counted by all endpoints and
//                     freed when the last endpoint is destroyed.
// Links: src/term/channel_backend.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace tvkit::support
{

/// @brief Outcome of a receive attempt.
enum class RecvStatus
{
    Ok,
    Empty,
    Disconnected,
};

template <typename T> struct RecvResult
{
    RecvStatus status{RecvStatus::Empty};
    std::optional<T> value;
};

namespace detail
{
template <typename T> struct ChannelState
{
    std::mutex mu;
    std::condition_variable cv;
    std::deque<T> queue;
    std::size_t senders = 0;
    bool receiverAlive = true;
};
} // namespace detail

template <typename T> class Receiver;

/// @brief Sending endpoint; copies share the channel and count as producers.
template <typename T> class Sender
{
  public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state))
    {
        attach();
    }

    Sender(const Sender &other) : state_(other.state_)
    {
        attach();
    }

    Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}

    Sender &operator=(Sender other) noexcept
    {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender()
    {
        close();
    }

    /// @brief Queue @p value for the receiver.
    /// @return False when the sender is closed or the receiver has gone away.
    bool send(T value)
    {
        if (!state_)
        {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            if (!state_->receiverAlive)
            {
                return false;
            }
            state_->queue.push_back(std::move(value));
        }
        state_->cv.notify_one();
        return true;
    }

    /// @brief Detach this endpoint; the last close disconnects the channel.
    void close()
    {
        if (!state_)
        {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            --state_->senders;
        }
        state_->cv.notify_all();
        state_.reset();
    }

    /// @brief Whether the receiving side is still alive.
    bool connected() const
    {
        if (!state_)
        {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mu);
        return state_->receiverAlive;
    }

  private:
    void attach()
    {
        if (state_)
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            ++state_->senders;
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/// @brief Receiving endpoint; move-only.
template <typename T> class Receiver
{
  public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;
    Receiver(Receiver &&) noexcept = default;

    Receiver &operator=(Receiver &&other) noexcept
    {
        if (this != &other)
        {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver()
    {
        release();
    }

    /// @brief Take the next message without blocking.
    RecvResult<T> tryRecv()
    {
        if (!state_)
        {
            return {RecvStatus::Disconnected, std::nullopt};
        }
        std::lock_guard<std::mutex> lock(state_->mu);
        return takeLocked();
    }

    /// @brief Wait up to @p timeout for the next message.
    RecvResult<T> recvFor(std::chrono::milliseconds timeout)
    {
        if (!state_)
        {
            return {RecvStatus::Disconnected, std::nullopt};
        }
        std::unique_lock<std::mutex> lock(state_->mu);
        state_->cv.wait_for(
            lock, timeout, [this] { return !state_->queue.empty() || state_->senders == 0; });
        return takeLocked();
    }

    /// @brief True once all senders are gone and the queue is drained.
    bool isDisconnected() const
    {
        if (!state_)
        {
            return true;
        }
        std::lock_guard<std::mutex> lock(state_->mu);
        return state_->senders == 0 && state_->queue.empty();
    }

  private:
    RecvResult<T> takeLocked()
    {
        if (!state_->queue.empty())
        {
            RecvResult<T> r{RecvStatus::Ok, std::move(state_->queue.front())};
            state_->queue.pop_front();
            return r;
        }
        if (state_->senders == 0)
        {
            return {RecvStatus::Disconnected, std::nullopt};
        }
        return {RecvStatus::Empty, std::nullopt};
    }

    void release()
    {
        if (!state_)
        {
            return;
        }
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->receiverAlive = false;
        state_->queue.clear();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/// @brief Create a connected sender/receiver pair.
template <typename T> std::pair<Sender<T>, Receiver<T>> makeChannel()
{
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace tvkit::support
