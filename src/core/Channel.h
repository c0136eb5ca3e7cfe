#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

// Unbounded, ordered, many-producer / one-consumer channel.
// The channel disconnects once every Sender is gone (receive side) or the
// Receiver is gone (send side).
template <typename T>
class Channel {
public:
    class Sender;
    class Receiver;

    static std::pair<Sender, Receiver> create() {
        auto state = std::make_shared<State>();
        return { Sender(state), Receiver(state) };
    }

private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        std::deque<T> queue;
        std::atomic<int> senders{0};
        std::atomic<bool> receiver_alive{true};
    };

public:
    class Sender {
    public:
        Sender() = default;

        explicit Sender(std::shared_ptr<State> s) : state(std::move(s)) {
            if (state) state->senders.fetch_add(1);
        }

        Sender(const Sender& other) : Sender(other.state) {}

        Sender(Sender&& other) noexcept : state(std::move(other.state)) {}

        Sender& operator=(Sender other) {
            std::swap(state, other.state);
            return *this;
        }

        ~Sender() { release(); }

        // False when the receiving side is gone
        bool send(T value) const {
            if (!state || !state->receiver_alive.load()) return false;
            {
                std::lock_guard<std::mutex> lock(state->mtx);
                state->queue.push_back(std::move(value));
            }
            state->cv.notify_one();
            return true;
        }

        bool valid() const { return state != nullptr; }

    private:
        void release() {
            if (!state) return;
            if (state->senders.fetch_sub(1) == 1) {
                std::lock_guard<std::mutex> lock(state->mtx);
                state->cv.notify_all();
            }
            state.reset();
        }

        std::shared_ptr<State> state;
    };

    class Receiver {
    public:
        Receiver() = default;
        explicit Receiver(std::shared_ptr<State> s) : state(std::move(s)) {}

        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;
        Receiver(Receiver&&) noexcept = default;
        Receiver& operator=(Receiver&&) noexcept = default;

        ~Receiver() {
            if (state) state->receiver_alive.store(false);
        }

        // Blocks until a value arrives; nullopt once disconnected and drained
        std::optional<T> recv() {
            std::unique_lock<std::mutex> lock(state->mtx);
            state->cv.wait(lock, [this] {
                return !state->queue.empty() || state->senders.load() == 0;
            });
            if (state->queue.empty()) return std::nullopt;
            T value = std::move(state->queue.front());
            state->queue.pop_front();
            return value;
        }

        std::optional<T> try_recv() {
            std::lock_guard<std::mutex> lock(state->mtx);
            if (state->queue.empty()) return std::nullopt;
            T value = std::move(state->queue.front());
            state->queue.pop_front();
            return value;
        }

        bool disconnected() const { return state->senders.load() == 0; }

    private:
        std::shared_ptr<State> state;
    };
};

template <typename T>
using Sender = typename Channel<T>::Sender;

template <typename T>
using Receiver = typename Channel<T>::Receiver;
