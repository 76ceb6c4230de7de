#include <rangewatch/runtime/change_stream.h>

#include <algorithm>
#include <utility>

namespace rangewatch {

namespace detail {

std::size_t SubscriberList::add(ChangeCallback callback) {
    auto id = next_id_++;
    slots_.push_back(std::make_shared<Slot>(Slot{id, std::move(callback)}));
    return id;
}

bool SubscriberList::remove(std::size_t id) {
    auto it = std::find_if(slots_.begin(), slots_.end(), [id](const auto& slot) { return slot->id == id; });
    if (it == slots_.end()) { return false; }
    (*it)->active = false;
    slots_.erase(it);
    return true;
}

bool SubscriberList::contains(std::size_t id) const {
    return std::any_of(slots_.begin(), slots_.end(), [id](const auto& slot) { return slot->id == id; });
}

void SubscriberList::emit(const ChangeEvent& event) const {
    auto snapshot = slots_;
    for (const auto& slot : snapshot) {
        if (slot->active) { slot->callback(event); }
    }
}

}  // namespace detail

Subscription::Subscription(std::weak_ptr<detail::SubscriberList> list, std::size_t id)
    : list_(std::move(list)), id_(id) {}

Subscription::Subscription(Subscription&& other) noexcept
    : list_(std::move(other.list_)), id_(std::exchange(other.id_, 0)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        list_ = std::move(other.list_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (auto list = list_.lock()) { list->remove(id_); }
    list_.reset();
    id_ = 0;
}

bool Subscription::is_active() const {
    auto list = list_.lock();
    return list && id_ != 0 && list->contains(id_);
}

ScopedSubscription& ScopedSubscription::operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
        subscription_.unsubscribe();
        subscription_ = std::move(other.subscription_);
    }
    return *this;
}

ChangeStream::ChangeStream(std::weak_ptr<detail::SubscriberList> source, ChangePredicate predicate,
                           subscribe_hook on_subscribe)
    : source_(std::move(source)), on_subscribe_(std::move(on_subscribe)) {
    if (predicate) {
        pipeline_ = [predicate = std::move(predicate)](ChangeEvent& event) { return predicate(event); };
    }
}

ChangeStream ChangeStream::filter(ChangePredicate predicate) const {
    if (!predicate) { return *this; }
    auto stream = *this;
    stream.pipeline_ = [previous = pipeline_, predicate = std::move(predicate)](ChangeEvent& event) {
        return (!previous || previous(event)) && predicate(event);
    };
    return stream;
}

ChangeStream ChangeStream::map(mapper_type mapper) const {
    if (!mapper) { return *this; }
    auto stream = *this;
    stream.pipeline_ = [previous = pipeline_, mapper = std::move(mapper)](ChangeEvent& event) {
        if (previous && !previous(event)) { return false; }
        event = mapper(event);
        return true;
    };
    return stream;
}

Subscription ChangeStream::subscribe(ChangeCallback callback) const {
    auto source = source_.lock();
    if (!source || !callback) { return {}; }

    ChangeCallback deliver;
    if (pipeline_) {
        deliver = [pipeline = pipeline_, callback = std::move(callback)](const ChangeEvent& event) {
            auto staged = event;
            if (pipeline(staged)) { callback(staged); }
        };
    } else {
        deliver = std::move(callback);
    }
    Subscription subscription{source, source->add(deliver)};
    if (on_subscribe_) { on_subscribe_(deliver); }
    return subscription;
}

ChangeSubject::ChangeSubject() : subscribers_(std::make_shared<detail::SubscriberList>()) {}

Subscription ChangeSubject::subscribe(ChangeCallback callback) {
    return ChangeStream{subscribers_}.subscribe(std::move(callback));
}

void ChangeSubject::next(const ChangeEvent& event) const {
    // Keep the list alive for the whole delivery even if a subscriber tears the subject down.
    auto subscribers = subscribers_;
    subscribers->emit(event);
}

ChangeStream ChangeSubject::as_stream(ChangePredicate predicate, ChangeStream::subscribe_hook on_subscribe) const {
    return ChangeStream{subscribers_, std::move(predicate), std::move(on_subscribe)};
}

}  // namespace rangewatch
