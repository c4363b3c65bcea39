#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>

namespace rctx {

namespace detail {

template <typename T, typename = void>
struct HasDescribe : std::false_type {};

template <typename T>
struct HasDescribe<T, std::void_t<decltype(std::declval<const T&>().describe())>>
  : std::true_type {};

template <typename T>
struct IsStdFunction : std::false_type {};

template <typename Sig>
struct IsStdFunction<std::function<Sig>> : std::true_type {};

} // namespace detail

/// Diagnostic display form of a task.
///  - a `describe()` member wins;
///  - a std::function reports the demangled type of its target;
///  - otherwise the demangled type name.
template <typename F>
std::string describe(const F& task) {
  if constexpr (detail::HasDescribe<F>::value) {
    return std::string(task.describe());
  } else if constexpr (detail::IsStdFunction<F>::value) {
    if (!task) return "<empty>";
    return boost::core::demangle(task.target_type().name());
  } else {
    return boost::core::demangle(typeid(F).name());
  }
}

/// A callable carrying a human-readable name for logs and diagnostics.
template <typename F>
class NamedTask {
public:
  NamedTask(std::string name, F fn) : name_(std::move(name)), fn_(std::move(fn)) {}

  decltype(auto) operator()() { return std::invoke(fn_); }

  const std::string& describe() const noexcept { return name_; }

private:
  std::string name_;
  F           fn_;
};

template <typename F>
NamedTask<std::decay_t<F>> named(std::string name, F&& fn) {
  return NamedTask<std::decay_t<F>>(std::move(name), std::forward<F>(fn));
}

} // namespace rctx
