#pragma once

#include "utcnow/canonical.hpp"
#include "utcnow/date_time.hpp"
#include "utcnow/detail/resolve.hpp"
#include "utcnow/error.hpp"
#include "utcnow/input.hpp"
#include "utcnow/instant.hpp"

#include <mutex>
#include <optional>
#include <utility>

#include <cstdint>

namespace utcnow {

class Synchronizer;

/// Lifecycle of a SyncFrame
enum class FrameState : uint8_t {
    pending,    ///< Created, not yet entered
    active,     ///< Entered and holding the synchronizer's slot
    superseded, ///< Entered, then replaced by a newer frame
    closed      ///< Exited (or moved from)
};

constexpr const char* frame_state_string(FrameState state) noexcept {
    switch (state) {
        case FrameState::pending:
            return "pending";
        case FrameState::active:
            return "active";
        case FrameState::superseded:
            return "superseded";
        case FrameState::closed:
            return "closed";
        default:
            return "unknown";
    }
}

/**
 * @brief Activation token that freezes a Synchronizer's "current instant"
 *
 * Created pending by Synchronizer::frame(). enter() resolves the frame's
 * value and modifier once (Now uses the real clock), stores the result in
 * the synchronizer's single slot and returns it. Until the frame exits,
 * every clock read through that synchronizer returns this frozen instant.
 *
 * Entering a second frame supersedes the first: the first frame's reads and
 * exit() then fail with frame_superseded, and exiting the second frame
 * returns the synchronizer to the real clock.
 *
 * Frames are move-only. Destroying an active frame exits it. A frame must
 * not outlive its Synchronizer.
 *
 * Example usage:
 * @code
 *   auto frame = Synchronizer::global().frame("2000-01-01 00:00");
 *   frame.enter();
 *   utcnow::rfc3339_timestamp();   // "2000-01-01T00:00:00.000000Z"
 *   frame.exit();
 * @endcode
 */
class SyncFrame {
public:
    SyncFrame(SyncFrame&& other) noexcept
        : sync_(std::exchange(other.sync_, nullptr)),
          id_(other.id_),
          value_(std::move(other.value_)),
          modifier_(std::move(other.modifier_)),
          state_(std::exchange(other.state_, FrameState::closed)),
          frozen_(other.frozen_) {}

    SyncFrame& operator=(SyncFrame&& other) noexcept {
        if (this != &other) {
            release();
            sync_ = std::exchange(other.sync_, nullptr);
            id_ = other.id_;
            value_ = std::move(other.value_);
            modifier_ = std::move(other.modifier_);
            state_ = std::exchange(other.state_, FrameState::closed);
            frozen_ = other.frozen_;
        }
        return *this;
    }

    SyncFrame(const SyncFrame&) = delete;
    SyncFrame& operator=(const SyncFrame&) = delete;

    ~SyncFrame() { release(); }

    /**
     * Activate the frame.
     *
     * @return The frozen instant, frame_not_pending if the frame was already
     *         entered, or the conversion error of the frame's value/modifier
     *         (the frame then stays pending and the slot is untouched)
     */
    Result<Instant> enter();

    /**
     * Deactivate the frame and resume the real clock.
     *
     * @return frame_superseded if a newer frame replaced this one,
     *         frame_not_active if the frame is pending or closed
     */
    Result<void> exit();

    /// Current state, reflecting supersession by newer frames
    [[nodiscard]] FrameState state() const;

    [[nodiscard]] bool is_active() const { return state() == FrameState::active; }

    // === Reads (only while active) ===

    [[nodiscard]] Result<Instant> instant() const;

    [[nodiscard]] Result<CanonicalString> rfc3339() const {
        return instant().and_then(
            [](const Instant& i) { return CanonicalString::from_instant(i); });
    }

    [[nodiscard]] Result<double> unixtime() const {
        return instant().map([](const Instant& i) { return i.to_unixtime(); });
    }

    [[nodiscard]] Result<DateTime> datetime() const {
        return instant().map([](const Instant& i) { return DateTime::from_instant(i); });
    }

    /// Nanoseconds since the epoch, microsecond resolution
    [[nodiscard]] Result<int64_t> time_ns() const {
        return instant().and_then([](const Instant& i) { return i.to_nanoseconds(); });
    }

private:
    friend class Synchronizer;

    SyncFrame(Synchronizer& sync, uint64_t id, TimestampInput value, ModifierInput modifier)
        : sync_(&sync),
          id_(id),
          value_(std::move(value)),
          modifier_(std::move(modifier)) {}

    /// Error for a frame that cannot be read or exited
    [[nodiscard]] Error misuse_error(FrameState current) const {
        return Error{current == FrameState::superseded ? ErrorCode::frame_superseded
                                                       : ErrorCode::frame_not_active,
                     frame_state_string(current)};
    }

    void release() noexcept;

    Synchronizer* sync_{nullptr};
    uint64_t id_{0};
    TimestampInput value_{};
    ModifierInput modifier_{};
    FrameState state_{FrameState::pending};
    Instant frozen_{};
};

/**
 * @brief Injectable clock override with one global active slot
 *
 * now() returns the active frame's frozen instant, or the real clock when no
 * frame is active. All state changes happen under one mutex, so the
 * "last entered wins" order is total even across threads.
 *
 * Synchronizer::global() is the process-wide instance used by the free
 * conversion functions; tests can create private instances and hand them
 * to a Converter.
 */
class Synchronizer {
public:
    Synchronizer() = default;
    Synchronizer(const Synchronizer&) = delete;
    Synchronizer& operator=(const Synchronizer&) = delete;

    static Synchronizer& global() {
        static Synchronizer instance;
        return instance;
    }

    /// Frozen instant of the active frame, else the real clock
    [[nodiscard]] Instant now() const {
        std::lock_guard lock(mutex_);
        return active_id_ != 0 ? frozen_ : Instant::now();
    }

    [[nodiscard]] bool active() const {
        std::lock_guard lock(mutex_);
        return active_id_ != 0;
    }

    [[nodiscard]] std::optional<Instant> frozen() const {
        std::lock_guard lock(mutex_);
        if (active_id_ == 0) {
            return std::nullopt;
        }
        return frozen_;
    }

    /**
     * Create a pending frame. Nothing changes until the frame is entered.
     *
     * @param value Instant to freeze (default: real clock at enter())
     * @param modifier Shift applied to the value at enter()
     */
    [[nodiscard]] SyncFrame frame(TimestampInput value = Now{}, ModifierInput modifier = {}) {
        std::lock_guard lock(mutex_);
        return SyncFrame(*this, next_id_++, std::move(value), std::move(modifier));
    }

private:
    friend class SyncFrame;

    mutable std::mutex mutex_;
    uint64_t next_id_{1};
    uint64_t active_id_{0}; ///< 0 = no active frame
    Instant frozen_{};
};

// === SyncFrame out-of-line members (need the complete Synchronizer) ===

inline Result<Instant> SyncFrame::enter() {
    if (sync_ == nullptr) {
        return make_unexpected(misuse_error(FrameState::closed));
    }
    {
        std::lock_guard lock(sync_->mutex_);
        if (state_ != FrameState::pending) {
            return make_error(ErrorCode::frame_not_pending, frame_state_string(state_));
        }
    }
    auto resolved = detail::resolve(value_, modifier_, [] { return Instant::now(); });
    if (!resolved) {
        return resolved;
    }
    std::lock_guard lock(sync_->mutex_);
    if (state_ != FrameState::pending) {
        return make_error(ErrorCode::frame_not_pending, frame_state_string(state_));
    }
    sync_->active_id_ = id_;
    sync_->frozen_ = *resolved;
    frozen_ = *resolved;
    state_ = FrameState::active;
    return *resolved;
}

inline Result<void> SyncFrame::exit() {
    if (sync_ == nullptr) {
        return make_unexpected(misuse_error(FrameState::closed));
    }
    std::lock_guard lock(sync_->mutex_);
    if (state_ == FrameState::active && sync_->active_id_ != id_) {
        state_ = FrameState::superseded;
    }
    if (state_ != FrameState::active) {
        return make_unexpected(misuse_error(state_));
    }
    sync_->active_id_ = 0;
    state_ = FrameState::closed;
    return {};
}

inline FrameState SyncFrame::state() const {
    if (sync_ == nullptr) {
        return FrameState::closed;
    }
    std::lock_guard lock(sync_->mutex_);
    if (state_ == FrameState::active && sync_->active_id_ != id_) {
        return FrameState::superseded;
    }
    return state_;
}

inline Result<Instant> SyncFrame::instant() const {
    const FrameState current = state();
    if (current != FrameState::active) {
        return make_unexpected(misuse_error(current));
    }
    return frozen_;
}

inline void SyncFrame::release() noexcept {
    if (sync_ == nullptr || state_ != FrameState::active) {
        return;
    }
    std::lock_guard lock(sync_->mutex_);
    if (sync_->active_id_ == id_) {
        sync_->active_id_ = 0;
    }
    state_ = FrameState::closed;
}

} // namespace utcnow
