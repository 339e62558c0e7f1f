#pragma once

#include <monitor/sync/conditional_mutex.hpp>

#include <fmt/format.h>

// fmt support for guards and mutexes
//
// fmt::format("{}", mutex) never blocks: a mutex held by anyone,
// the formatting thread included, prints as <locked>

template <typename T>
struct fmt::formatter<monitor::sync::Guard<T>> : fmt::formatter<T> {
  template <typename FormatContext>
  auto format(const monitor::sync::Guard<T>& guard, FormatContext& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<T>::format(*guard, ctx);
  }
};

template <typename T>
struct fmt::formatter<monitor::sync::ConditionalMutex<T>> {
  constexpr auto parse(fmt::format_parse_context& ctx)
      -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const monitor::sync::ConditionalMutex<T>& mutex,
              FormatContext& ctx) const -> decltype(ctx.out()) {
    // TryLock does not change the protected state
    auto& target = const_cast<monitor::sync::ConditionalMutex<T>&>(mutex);

    auto attempt = target.TryLock();
    if (!attempt) {
      return fmt::format_to(ctx.out(),
                            "ConditionalMutex {{ data: <locked>, poisoned: {} }}",
                            mutex.IsPoisoned());
    }

    // Poisoned or not, we got the lock
    auto guard = attempt->has_value() ? std::move(*attempt).value()
                                      : std::move(attempt->error()).IntoInner();

    return fmt::format_to(ctx.out(),
                          "ConditionalMutex {{ data: {}, poisoned: {} }}",
                          *guard, mutex.IsPoisoned());
  }
};
