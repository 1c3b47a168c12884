//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>

constexpr std::size_t LogRingBufferMaxSize = 65'536;
constexpr std::size_t OutcomeRingBufferMaxSize = 4'096;

enum class SlotState {
    VACANT,
    WRITING,
    WRITTEN,
    READING,
};

enum class RingState {
    FULL,
    EMPTY,
    SUCCESS,
};

struct PolledIdx {
    size_t idx_in_buffer;
};

template<typename T>
struct RingResult {
    RingState state;
    std::optional<T> content;

    RingResult(RingState state_, std::optional<T> content_)
    : state(state_), content(std::move(content_)) {}
};

// A slot moves VACANT -> WRITING -> WRITTEN -> READING -> VACANT. The
// claimed index in the ring decides who may touch a slot; the state decides
// when, so a producer one lap ahead waits for the reader still on it.
template <typename T>
class Slot {
public:
    bool state_compare_exchange_weak(SlotState& expected, SlotState new_state) {
        return state.compare_exchange_weak(expected, new_state, std::memory_order_acq_rel);
    }

    void set(T&& to_set) {
        value = std::move(to_set);
        state.store(SlotState::WRITTEN, std::memory_order_release);
    }

    T take() {
        T taken = std::move(value);
        value = T{};
        state.store(SlotState::VACANT, std::memory_order_release);
        return taken;
    }

private:
    std::atomic<SlotState> state{SlotState::VACANT};
    T value{};
};

template <typename T, std::size_t N>
struct RingBuffer {
    virtual ~RingBuffer() = default;

    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};

    std::array<Slot<T>, N> data;

    bool is_empty() const {
        return (tail.load(std::memory_order_acquire) == head.load(std::memory_order_acquire));
    }

    size_t size() const {
        return head.load(std::memory_order_acquire) - tail.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() {
        return N - 1;
    }

    std::optional<PolledIdx> try_claim_head() {
        while (true) {
            size_t t = this->tail.load(std::memory_order_acquire);
            size_t h = this->head.load(std::memory_order_acquire);
            if ((h+1) % N == t % N) {
                return std::nullopt;  // full
            }
            if (this->head.compare_exchange_weak(h, h + 1, std::memory_order_acq_rel)) {
                return PolledIdx{h % N};
            }
        }
    }

    std::optional<PolledIdx> try_claim_tail() {
        while (true) {
            size_t t = this->tail.load(std::memory_order_acquire);
            size_t h = this->head.load(std::memory_order_acquire);
            if (t == h) {
                return std::nullopt;  // empty
            }
            if (this->tail.compare_exchange_weak(t, t + 1, std::memory_order_acq_rel)) {
                return PolledIdx{t % N};
            }
        }
    }

    T receive_from_slot(PolledIdx tail_state) {
        auto& slot = data[tail_state.idx_in_buffer];
        while (true) {
            SlotState expected = SlotState::WRITTEN;
            if (slot.state_compare_exchange_weak(expected, SlotState::READING)) {
                return slot.take();
            }
            std::this_thread::yield();
        }
    }

    void send_to_slot(PolledIdx head_state, T&& content) {
        auto& slot = data[head_state.idx_in_buffer];
        while (true) {
            SlotState expected = SlotState::VACANT;
            if (slot.state_compare_exchange_weak(expected, SlotState::WRITING)) {
                slot.set(std::move(content));
                break;
            }
            std::this_thread::yield();
        }
    }
};

// Many threads push, exactly one thread fetches. Used as the channel from
// request workers to the outcome collector and from log callers to the
// logger thread.
template<typename T, std::size_t N = OutcomeRingBufferMaxSize>
struct MPSCRingBuffer : RingBuffer<T, N> {

    ~MPSCRingBuffer() = default;
    MPSCRingBuffer() = default;

    RingState push(T content);

    // Blocks (yielding) while the ring is full
    void push_blocking(T content);

    RingResult<T> fetch();
};


template<typename T, std::size_t N>
RingState MPSCRingBuffer<T, N>::push(T content) {
    auto maybe_head = this->try_claim_head();
    if (!maybe_head.has_value()) {
        return RingState::FULL;
    }
    this->send_to_slot(maybe_head.value(), std::move(content));
    return RingState::SUCCESS;
}

template<typename T, std::size_t N>
void MPSCRingBuffer<T, N>::push_blocking(T content) {
    while (true) {
        auto maybe_head = this->try_claim_head();
        if (maybe_head.has_value()) {
            this->send_to_slot(maybe_head.value(), std::move(content));
            return;
        }
        std::this_thread::yield();
    }
}

template<typename T, std::size_t N>
RingResult<T> MPSCRingBuffer<T, N>::fetch() {
    auto maybe_tail = this->try_claim_tail();
    if (!maybe_tail.has_value()) {
        return RingResult<T>(RingState::EMPTY, std::nullopt);
    }
    return RingResult<T>(RingState::SUCCESS, std::make_optional(this->receive_from_slot(maybe_tail.value())));
}
