#pragma once

#include "hearth/focus/FocusId.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

namespace hearth::focus
{

//! Single source of truth for the focused element. Writes are published
//! synchronously to every subscriber, in subscription order.
class FocusStore
{
  public:
    using Callback = std::function<void(const FocusId&)>;
    using SubscriptionId = std::size_t;

    void Set(FocusId id);
    void Clear() { Set(FocusId{}); }

    [[nodiscard]] const FocusId& Get() const noexcept { return value_; }
    [[nodiscard]] bool HasFocus() const noexcept { return !value_.empty(); }
    [[nodiscard]] bool IsFocused(std::string_view id) const noexcept;

    SubscriptionId Subscribe(Callback callback);
    void Unsubscribe(SubscriptionId id);

    [[nodiscard]] std::size_t SubscriberCount() const noexcept;

  private:
    struct Subscriber
    {
        SubscriptionId id{};
        Callback callback;
        bool active = true;
    };

    class NotifyScope
    {
      public:
        explicit NotifyScope(FocusStore& store) noexcept;
        ~NotifyScope();

        NotifyScope(const NotifyScope&) = delete;
        NotifyScope& operator=(const NotifyScope&) = delete;

      private:
        FocusStore& store_;
    };

    void Notify();
    void CompactSubscribers();

    FocusId value_;
    std::uint64_t generation_ = 0;
    std::vector<Subscriber> subscribers_;
    SubscriptionId nextSubscriptionId_ = 1;
    int notifyDepth_ = 0;
};

//! Per-element view of the store. Keeps the element's highlighted state
//! current and detaches itself on destruction.
class FocusBinding
{
  public:
    using ChangedCallback = std::function<void(bool focused)>;

    FocusBinding(FocusStore& store, FocusId id, ChangedCallback onChanged = {});
    ~FocusBinding();

    FocusBinding(const FocusBinding&) = delete;
    FocusBinding& operator=(const FocusBinding&) = delete;
    FocusBinding(FocusBinding&&) = delete;
    FocusBinding& operator=(FocusBinding&&) = delete;

    [[nodiscard]] const FocusId& Id() const noexcept { return id_; }
    [[nodiscard]] bool Focused() const noexcept { return focused_; }
    [[nodiscard]] int EvaluationCount() const noexcept { return evaluations_; }

  private:
    void Evaluate(const FocusId& current);

    FocusStore& store_;
    FocusId id_;
    ChangedCallback onChanged_;
    FocusStore::SubscriptionId subscription_{};
    bool focused_ = false;
    int evaluations_ = 0;
};

} // namespace hearth::focus
