#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>

namespace agen {

/// A value as seen by generator bodies and consumers. `std::nullopt` stands for `undefined`.
template <typename T>
using MaybeValue = std::optional<T>;

enum class ResumeKind : uint8_t {
    Next,
    Return,
    Throw,
};

constexpr std::string_view kindName(ResumeKind kind) noexcept {
    switch (kind) {
        case ResumeKind::Next: return "next";
        case ResumeKind::Return: return "return";
        case ResumeKind::Throw: return "throw";
    }

    return "<invalid>";
}

/// The value or error a paused `yield`/`await` expression observes when execution resumes.
template <typename T>
struct Resumption {
    ResumeKind kind = ResumeKind::Next;
    MaybeValue<T> value;
    std::exception_ptr error;

    static Resumption next(MaybeValue<T> value = std::nullopt) {
        return Resumption{ResumeKind::Next, std::move(value), nullptr};
    }

    static Resumption returning(MaybeValue<T> value = std::nullopt) {
        return Resumption{ResumeKind::Return, std::move(value), nullptr};
    }

    static Resumption throwing(std::exception_ptr error) {
        return Resumption{ResumeKind::Throw, std::nullopt, std::move(error)};
    }
};

/// What a settled `next`/`return`/`throw` request fulfills with.
template <typename T>
struct IterResult {
    MaybeValue<T> value;
    bool done = false;

    bool operator==(const IterResult&) const = default;
};

}
