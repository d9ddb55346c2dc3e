#include "hearth/focus/FocusStore.hpp"

#include <algorithm>
#include <utility>

namespace hearth::focus
{

void FocusStore::Set(FocusId id)
{
    if (id == value_)
    {
        return;
    }

    value_ = std::move(id);
    ++generation_;
    Notify();
}

bool FocusStore::IsFocused(std::string_view id) const noexcept
{
    return !value_.empty() && value_ == id;
}

FocusStore::SubscriptionId FocusStore::Subscribe(Callback callback)
{
    const SubscriptionId id = nextSubscriptionId_++;
    subscribers_.push_back(Subscriber{id, std::move(callback), true});
    return id;
}

void FocusStore::Unsubscribe(SubscriptionId id)
{
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(), [id](const Subscriber& subscriber) {
        return subscriber.id == id;
    });
    if (it == subscribers_.end())
    {
        return;
    }

    // Removal is deferred while a notification is walking the list.
    it->active = false;
    if (notifyDepth_ == 0)
    {
        CompactSubscribers();
    }
}

std::size_t FocusStore::SubscriberCount() const noexcept
{
    return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(), [](const Subscriber& subscriber) {
        return subscriber.active;
    }));
}

void FocusStore::Notify()
{
    const FocusId snapshot = value_;
    const std::uint64_t generation = generation_;
    const std::size_t count = subscribers_.size();

    {
        NotifyScope scope{*this};
        for (std::size_t index = 0; index < count && index < subscribers_.size(); ++index)
        {
            if (!subscribers_[index].active || !subscribers_[index].callback)
            {
                continue;
            }

            // Copy so a callback may subscribe without invalidating itself.
            const Callback callback = subscribers_[index].callback;
            callback(snapshot);

            // A write from inside a callback has already reached every subscriber.
            if (generation_ != generation)
            {
                break;
            }
        }
    }

    if (notifyDepth_ == 0)
    {
        CompactSubscribers();
    }
}

FocusStore::NotifyScope::NotifyScope(FocusStore& store) noexcept
    : store_{store}
{
    ++store_.notifyDepth_;
}

FocusStore::NotifyScope::~NotifyScope()
{
    --store_.notifyDepth_;
}

void FocusStore::CompactSubscribers()
{
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(), [](const Subscriber& subscriber) {
            return !subscriber.active;
        }),
        subscribers_.end());
}

FocusBinding::FocusBinding(FocusStore& store, FocusId id, ChangedCallback onChanged)
    : store_{store}
    , id_{std::move(id)}
    , onChanged_{std::move(onChanged)}
{
    focused_ = store_.IsFocused(id_);
    subscription_ = store_.Subscribe([this](const FocusId& current) { Evaluate(current); });
}

FocusBinding::~FocusBinding()
{
    store_.Unsubscribe(subscription_);
}

void FocusBinding::Evaluate(const FocusId& current)
{
    ++evaluations_;
    const bool focused = !current.empty() && current == id_;
    if (focused == focused_)
    {
        return;
    }

    focused_ = focused;
    if (onChanged_)
    {
        onChanged_(focused_);
    }
}

} // namespace hearth::focus
