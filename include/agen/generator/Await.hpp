#pragma once
#include "Resumption.hpp"
#include <agen/promise/Deferred.hpp>
#include <agen/scheduler/AwaitScheduler.hpp>
#include <agen/util/Function.hpp>
#include <agen/util/Result.hpp>
#include <memory>
#include <variant>

namespace agen {

/// Settlement of an awaited value, delivered back into the generator exactly once.
template <typename T>
using AwaitResult = Result<MaybeValue<T>, std::exception_ptr>;

/// Something a generator body suspends on with `await`: a promise, or a value that is already available.
/// Even a ready value is delivered through the scheduler, never synchronously.
template <typename T>
class Awaited {
public:
    static Awaited ready(MaybeValue<T> value) {
        return Awaited{Source{std::in_place_index<0>, std::move(value)}};
    }

    static Awaited promise(Promise<MaybeValue<T>> promise) {
        return Awaited{Source{std::in_place_index<1>, std::move(promise)}};
    }

    bool isReady() const noexcept {
        return m_source.index() == 0;
    }

    /// Arranges for `callback` to be posted onto `scheduler` once the awaited value settles.
    void subscribe(AwaitScheduler& scheduler, MoveOnlyFunction<void(AwaitResult<T>)> callback) && {
        if (auto value = std::get_if<0>(&m_source)) {
            scheduler.post([cb = std::move(callback), v = std::move(*value)]() mutable {
                cb(Ok(std::move(v)));
            });
            return;
        }

        // exactly one of the two reactions runs, both share the callback
        auto shared = std::make_shared<MoveOnlyFunction<void(AwaitResult<T>)>>(std::move(callback));

        std::get<1>(m_source).then(
            [&scheduler, shared](const MaybeValue<T>& value) {
                scheduler.post([shared, value]() {
                    (*shared)(Ok(value));
                });
            },
            [&scheduler, shared](std::exception_ptr error) {
                scheduler.post([shared, error]() {
                    (*shared)(Err(error));
                });
            }
        );
    }

private:
    using Source = std::variant<MaybeValue<T>, Promise<MaybeValue<T>>>;

    explicit Awaited(Source source) : m_source(std::move(source)) {}

    Source m_source;
};

}
