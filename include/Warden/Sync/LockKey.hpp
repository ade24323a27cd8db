/// @file LockKey.hpp
/// @brief Value-equal keys naming the locks of a KeyedLockRegistry.
#pragma once

#include <Warden/Defines.hpp>
#include <Warden/Primitives.hpp>

#include <bit>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Warden::Sync
{
    /// @brief An address compared by identity rather than by the contents it points at.
    struct IdentityToken final
    {
        const void* address {nullptr};

        friend constexpr bool operator==(IdentityToken, IdentityToken) noexcept = default;
    };

    /// @brief One component of a lock key.
    ///
    /// Holds null, a bool, a signed or unsigned integer, a double, a string or an identity token.
    /// Values of different alternatives never compare equal, so `KeyValue(1)` and `KeyValue(1u)`
    /// name different locks. Doubles compare by bit pattern.
    class KeyValue
    {
    public:
        using Storage = std::variant<std::monostate, bool, Int64, UInt64, F64, std::string, IdentityToken>;

        KeyValue() noexcept = default;
        KeyValue(std::nullptr_t) noexcept {}
        KeyValue(bool value) noexcept
            : m_storage(std::in_place_type<bool>, value)
        {
        }

        template<std::signed_integral T>
            requires(!std::same_as<T, bool>)
        KeyValue(T value) noexcept
            : m_storage(std::in_place_type<Int64>, static_cast<Int64>(value))
        {
        }

        template<std::unsigned_integral T>
            requires(!std::same_as<T, bool>)
        KeyValue(T value) noexcept
            : m_storage(std::in_place_type<UInt64>, static_cast<UInt64>(value))
        {
        }

        template<std::floating_point T>
        KeyValue(T value) noexcept
            : m_storage(std::in_place_type<F64>, static_cast<F64>(value))
        {
        }

        KeyValue(const char* value)
        {
            if (value != nullptr)
                m_storage.emplace<std::string>(value);
        }

        KeyValue(std::string value) noexcept
            : m_storage(std::in_place_type<std::string>, std::move(value))
        {
        }

        KeyValue(std::string_view value)
            : m_storage(std::in_place_type<std::string>, value)
        {
        }

        /// Raw pointers would otherwise silently convert to bool.
        template<typename T>
        KeyValue(T*) = delete;

        /// @brief A value that names the object at @p address, independent of its contents.
        [[nodiscard]] static KeyValue Identity(const void* address) noexcept
        {
            KeyValue value;
            value.m_storage = IdentityToken {address};
            return value;
        }

        [[nodiscard]] bool IsNull() const noexcept { return std::holds_alternative<std::monostate>(m_storage); }

        [[nodiscard]] const Storage& GetStorage() const noexcept { return m_storage; }

        template<typename T>
        [[nodiscard]] bool Holds() const noexcept
        {
            return std::holds_alternative<T>(m_storage);
        }

        [[nodiscard]] UIntSize Hash() const noexcept;

        [[nodiscard]] std::string ToString() const;

        friend bool operator==(const KeyValue& a, const KeyValue& b) noexcept
        {
            if (a.m_storage.index() != b.m_storage.index())
                return false;
            if (const auto* lhs = std::get_if<F64>(&a.m_storage))
                return std::bit_cast<UInt64>(*lhs) == std::bit_cast<UInt64>(std::get<F64>(b.m_storage));
            return a.m_storage == b.m_storage;
        }

    private:
        Storage m_storage {};
    };

    /// @brief Tagged lock key: a single value or an ordered composite of values.
    ///
    /// Construction normalizes the representation so that equal keys always have equal state:
    /// a composite of exactly one value becomes a single key of that value. `Null()` and `Empty()`
    /// are the canonical sentinels for a null single key and a composite of zero values.
    /// The hash is computed once and cached.
    class LockKey
    {
    public:
        enum class Kind : UInt8
        {
            Single,
            Composite,
        };

        /// @brief Equivalent to Null().
        LockKey()
            : LockKey(Kind::Single, std::vector<KeyValue>(1))
        {
        }

        [[nodiscard]] static LockKey Single(KeyValue value)
        {
            std::vector<KeyValue> values;
            values.push_back(std::move(value));
            return LockKey(Kind::Single, std::move(values));
        }

        [[nodiscard]] static LockKey Composite(std::vector<KeyValue> values)
        {
            if (values.size() == 1)
                return Single(std::move(values.front()));
            return LockKey(Kind::Composite, std::move(values));
        }

        [[nodiscard]] static LockKey Composite(std::span<const KeyValue> values)
        {
            return Composite(std::vector<KeyValue>(values.begin(), values.end()));
        }

        [[nodiscard]] static LockKey Composite(std::initializer_list<KeyValue> values)
        {
            return Composite(std::vector<KeyValue>(values));
        }

        /// @brief Composite of the arguments in order; one argument yields a single key.
        template<typename... Ts>
            requires(std::constructible_from<KeyValue, Ts &&> && ...)
        [[nodiscard]] static LockKey Of(Ts&&... values)
        {
            std::vector<KeyValue> components;
            components.reserve(sizeof...(Ts));
            (components.emplace_back(std::forward<Ts>(values)), ...);
            return Composite(std::move(components));
        }

        [[nodiscard]] static LockKey Null() { return Single(KeyValue {}); }
        [[nodiscard]] static LockKey Empty() { return LockKey(Kind::Composite, {}); }

        [[nodiscard]] Kind GetKind() const noexcept { return m_kind; }
        [[nodiscard]] bool IsSingle() const noexcept { return m_kind == Kind::Single; }
        [[nodiscard]] bool IsNull() const noexcept { return IsSingle() && m_values.front().IsNull(); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_kind == Kind::Composite && m_values.empty(); }

        /// @brief Components in order. A single key has exactly one.
        [[nodiscard]] std::span<const KeyValue> Values() const noexcept { return m_values; }

        [[nodiscard]] UIntSize Hash() const noexcept { return m_hash; }

        /// @brief `null`, the single value, or `[a, b, c]` for composites.
        [[nodiscard]] std::string ToString() const;

        friend bool operator==(const LockKey& a, const LockKey& b) noexcept
        {
            return a.m_hash == b.m_hash && a.m_kind == b.m_kind && a.m_values == b.m_values;
        }

    private:
        LockKey(Kind kind, std::vector<KeyValue> values);

        Kind                  m_kind;
        std::vector<KeyValue> m_values;
        UIntSize              m_hash {0};
    };

    struct LockKeyHash
    {
        [[nodiscard]] UIntSize operator()(const LockKey& key) const noexcept { return key.Hash(); }
    };
}// namespace Warden::Sync

template<>
struct std::hash<Warden::Sync::LockKey>
{
    [[nodiscard]] std::size_t operator()(const Warden::Sync::LockKey& key) const noexcept { return key.Hash(); }
};
