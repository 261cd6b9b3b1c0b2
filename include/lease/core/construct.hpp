#pragma once

#include "detail.hpp"
#include "factory.hpp"
#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace lease {

/// A factory whose acquisition succeeds with a copy of `value` and releases
/// nothing.
template<effect::host_effect E, typename T>
factory<E, std::decay_t<T>> pure(T&& value) {
    using V = std::decay_t<T>;
    return factory<E, V>([value = V(std::forward<T>(value))] {
        return E::pure(handle<E, V>{value, no_release<E>()});
    });
}

/// Wrap a computation-producing function into a factory with a no-op
/// release. `make` runs once per acquisition.
template<effect::host_effect E, typename F>
    requires std::invocable<F&>
factory<E, typename E::template value_of<std::invoke_result_t<F&>>> lift(F make) {
    using T = typename E::template value_of<std::invoke_result_t<F&>>;
    return factory<E, T>([make = std::move(make)]() mutable {
        return detail::fmap<E, T>(
            make(),
            [](T value) { return handle<E, T>{std::move(value), no_release<E>()}; });
    });
}

/// Wrap a copyable computation into a factory with a no-op release. Each
/// acquisition runs a copy of `m`; with an eager effect that copy has
/// already settled.
template<effect::host_effect E, typename M>
    requires (!std::invocable<M&>) && std::copy_constructible<M>
factory<E, typename E::template value_of<M>> lift(M m) {
    return lift<E>([m = std::move(m)] { return m; });
}

namespace detail {

template<typename P>
struct managed_pointer;

template<typename R>
struct managed_pointer<std::unique_ptr<R>> {
    using resource_type = R;
};

template<typename R>
struct managed_pointer<std::shared_ptr<R>> {
    using resource_type = R;
};

} // namespace detail

/// Something with a close() that gives the resource back
template<typename R>
concept closeable = requires(R& r) {
    r.close();
};

/// A factory over a closeable resource.
///
/// Every acquisition evaluates `construct` inside the host effect to open a
/// new resource (returned as std::unique_ptr<R> or std::shared_ptr<R>); the
/// handle's release calls R::close() inside the host effect. All acquisitions
/// share one `construct`, so a mutable one keeps its state between them.
template<effect::host_effect E, typename F>
factory<E, std::shared_ptr<typename detail::managed_pointer<std::invoke_result_t<F&>>::resource_type>>
managed(F construct) {
    using R = typename detail::managed_pointer<std::invoke_result_t<F&>>::resource_type;
    static_assert(closeable<R>, "managed() resources need a close() member");
    using pointer = std::shared_ptr<R>;

    return factory<E, pointer>([construct = std::make_shared<F>(std::move(construct))] {
        auto opened = E::delay([construct] { return pointer((*construct)()); });
        return detail::fmap<E, pointer>(std::move(opened), [](pointer resource) {
            release_function<E> release = [resource] {
                return E::delay([resource] {
                    resource->close();
                    return unit{};
                });
            };
            return handle<E, pointer>{std::move(resource), std::move(release)};
        });
    });
}

} // namespace lease
