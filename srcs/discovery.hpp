#pragma once
#include "errors.hpp"
#include "option.hpp"
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

// Turns member functions and callables into Handler records: captures the
// parameter kinds and the return kind once, at registration.

namespace tagmenu {

template <typename T>
struct ParamTraits {
    static constexpr ParamKind kind = ParamKind::Unsupported;
    // never reached: invokeHandler rejects Unsupported before calling
    static T resolve(InvokeContext&) {
        throw InvocationError("parameter type cannot be supplied", "dispatch");
    }
};

template <>
struct ParamTraits<RunFlag&> {
    static constexpr ParamKind kind = ParamKind::RunFlag;
    static RunFlag& resolve(InvokeContext& ctx) { return ctx.runFlag; }
};

template <>
struct ParamTraits<LineReader&> {
    static constexpr ParamKind kind = ParamKind::Input;
    static LineReader& resolve(InvokeContext& ctx) { return ctx.input; }
};

template <typename R>
struct ReturnTraits {
    static_assert(std::is_void<R>::value || std::is_same<R, bool>::value,
                  "menu handlers must return void or bool");
    static constexpr ReturnKind kind = std::is_void<R>::value ? ReturnKind::Void : ReturnKind::Boolean;
};

namespace detail {

template <typename... Args>
constexpr bool takesRunFlag() {
    return (false || ... || std::is_same<Args, RunFlag&>::value);
}

template <typename R, typename... Args>
constexpr void checkSignature() {
    static_assert(!(std::is_same<R, bool>::value && takesRunFlag<Args...>()),
                  "a handler stops the menu either by returning bool or through RunFlag&, not both");
}

// Address of the handler record: distinct for every registration.
inline std::string callableIdentity(const Handler* h) {
    std::ostringstream id;
    id << "callable@" << static_cast<const void*>(h);
    return id.str();
}

// Type name plus the bytes of the member pointer: equal for the same member.
template <typename Self, typename Fn>
std::string memberIdentity(Fn fn) {
    unsigned char bytes[sizeof(Fn)];
    std::memcpy(bytes, &fn, sizeof(Fn));
    std::string id = typeid(Self).name();
    id += "::@";
    char hex[3];
    for (unsigned char b : bytes) {
        std::snprintf(hex, sizeof(hex), "%02x", b);
        id += hex;
    }
    return id;
}

template <typename R, typename... Args, typename Call>
std::shared_ptr<Handler> makeHandler(Call call) {
    checkSignature<R, Args...>();
    auto h = std::make_shared<Handler>();
    h->params = { ParamTraits<Args>::kind... };
    h->returns = ReturnTraits<R>::kind;
    h->call = [call](InvokeContext& ctx) mutable -> Outcome {
        if constexpr (std::is_void<R>::value) {
            call(ParamTraits<Args>::resolve(ctx)...);
            return Continued{};
        } else {
            return Stopped{ static_cast<bool>(call(ParamTraits<Args>::resolve(ctx)...)) };
        }
    };
    return h;
}

template <typename F, typename R, typename... Args>
std::shared_ptr<const Handler> bindCallable(F f, R (F::*)(Args...) const) {
    auto h = makeHandler<R, Args...>([f](auto&&... a) -> R { return f(std::forward<decltype(a)>(a)...); });
    h->identity = callableIdentity(h.get());
    return h;
}

template <typename F, typename R, typename... Args>
std::shared_ptr<const Handler> bindCallable(F f, R (F::*)(Args...)) {
    auto h = makeHandler<R, Args...>([f](auto&&... a) mutable -> R { return f(std::forward<decltype(a)>(a)...); });
    h->identity = callableIdentity(h.get());
    return h;
}

} // namespace detail

// Member function of a menu subclass, bound to the instance.
template <typename Self, typename R, typename... Args>
std::shared_ptr<const Handler> bindMember(Self* self, R (Self::*fn)(Args...)) {
    auto h = detail::makeHandler<R, Args...>(
        [self, fn](auto&&... a) -> R { return (self->*fn)(std::forward<decltype(a)>(a)...); });
    h->identity = detail::memberIdentity<Self>(fn);
    return h;
}

template <typename Self, typename R, typename... Args>
std::shared_ptr<const Handler> bindMember(Self* self, R (Self::*fn)(Args...) const) {
    auto h = detail::makeHandler<R, Args...>(
        [self, fn](auto&&... a) -> R { return (self->*fn)(std::forward<decltype(a)>(a)...); });
    h->identity = detail::memberIdentity<Self>(fn);
    return h;
}

// Lambda or function object with a single operator().
template <typename F>
std::shared_ptr<const Handler> bindCallable(F f) {
    return detail::bindCallable(f, &F::operator());
}

} // namespace tagmenu
