#pragma once

/**
 * @file change_stream.h
 * @brief Broadcast of ChangeEvents to subscribers.
 *
 * ChangeSubject is the emitting side, ChangeStream a (possibly filtered) read-only view of a subject and
 * Subscription the handle a subscriber uses to stop delivery. Every subscriber receives every event that
 * passes its stream's filters, in emission order, until it unsubscribes. There is no replay.
 */

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/rangewatch_forward_declarations.h>
#include <rangewatch/types/change_event.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace rangewatch {

namespace detail {

/**
 * @brief The shared list of subscribers of a ChangeSubject.
 *
 * Delivery works on a snapshot of the list, so subscribers may subscribe or unsubscribe from inside a
 * callback. A subscriber removed during a delivery does not receive anything further, including the
 * rest of the event being delivered.
 */
class SubscriberList {
public:
    std::size_t add(ChangeCallback callback);

    bool remove(std::size_t id);

    [[nodiscard]] bool contains(std::size_t id) const;

    [[nodiscard]] std::size_t size() const { return slots_.size(); }

    void emit(const ChangeEvent& event) const;

private:
    struct Slot {
        std::size_t id;
        ChangeCallback callback;
        bool active{true};
    };

    std::vector<std::shared_ptr<Slot>> slots_;
    std::size_t next_id_{1};
};

}  // namespace detail

/**
 * @brief Handle to one subscriber. Move-only.
 *
 * Dropping the handle does not unsubscribe (see ScopedSubscription for that). The handle stays valid
 * after the subject has gone, it simply reports inactive.
 */
class RANGEWATCH_EXPORT Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<detail::SubscriberList> list, std::size_t id);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    ~Subscription() = default;

    /**
     * Stop delivery to this subscriber. Calling it again, or after the subject is gone, does nothing.
     */
    void unsubscribe();

    [[nodiscard]] bool is_active() const;

private:
    std::weak_ptr<detail::SubscriberList> list_;
    std::size_t id_{0};
};

/**
 * @brief Subscription that unsubscribes when it goes out of scope.
 */
class RANGEWATCH_EXPORT ScopedSubscription {
public:
    ScopedSubscription() = default;
    explicit ScopedSubscription(Subscription subscription) : subscription_(std::move(subscription)) {}

    ScopedSubscription(ScopedSubscription&&) noexcept = default;
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept;
    ~ScopedSubscription() { subscription_.unsubscribe(); }

    [[nodiscard]] bool is_active() const { return subscription_.is_active(); }

    Subscription release() { return std::move(subscription_); }

private:
    Subscription subscription_;
};

/**
 * @brief A filtered and mapped view of a subject.
 *
 * Stages apply in the order they were added. The optional subscribe hook runs after a subscriber has been
 * added and is handed that subscriber's delivery function (stages applied), it is how a source announces
 * its current state to the new subscriber alone.
 */
class RANGEWATCH_EXPORT ChangeStream {
public:
    using subscribe_hook = std::function<void(const ChangeCallback& deliver)>;
    using mapper_type = std::function<ChangeEvent(const ChangeEvent&)>;

    ChangeStream() = default;
    explicit ChangeStream(std::weak_ptr<detail::SubscriberList> source, ChangePredicate predicate = {},
                          subscribe_hook on_subscribe = {});

    /**
     * A stream delivering the events of this stream that also satisfy ``predicate``.
     */
    [[nodiscard]] ChangeStream filter(ChangePredicate predicate) const;

    /**
     * A stream delivering ``mapper`` applied to each event of this stream.
     */
    [[nodiscard]] ChangeStream map(mapper_type mapper) const;

    Subscription subscribe(ChangeCallback callback) const;

private:
    // Rewrites the event in place, false when a filter drops it.
    using pipeline_type = std::function<bool(ChangeEvent&)>;

    std::weak_ptr<detail::SubscriberList> source_;
    pipeline_type pipeline_;
    subscribe_hook on_subscribe_;
};

/**
 * @brief The emitting side of a broadcast.
 */
class RANGEWATCH_EXPORT ChangeSubject {
public:
    ChangeSubject();

    ChangeSubject(const ChangeSubject&) = delete;
    ChangeSubject& operator=(const ChangeSubject&) = delete;

    Subscription subscribe(ChangeCallback callback);

    void next(const ChangeEvent& event) const;

    [[nodiscard]] bool has_subscribers() const { return subscribers_->size() > 0; }

    [[nodiscard]] std::size_t size() const { return subscribers_->size(); }

    [[nodiscard]] ChangeStream as_stream(ChangePredicate predicate = {},
                                         ChangeStream::subscribe_hook on_subscribe = {}) const;

private:
    std::shared_ptr<detail::SubscriberList> subscribers_;
};

}  // namespace rangewatch
