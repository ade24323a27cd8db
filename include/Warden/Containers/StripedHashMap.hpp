/// @file StripedHashMap.hpp
/// @brief Concurrent hash map split into independently locked shards.
#pragma once

#include <Warden/Primitives.hpp>
#include <Warden/Sync/SpinLock.hpp>

#include <array>
#include <bit>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace Warden::Containers
{
    namespace detail
    {
        constexpr bool IsPowerOfTwo(std::size_t value) noexcept
        {
            return value != 0 && (value & (value - 1)) == 0;
        }
    }// namespace detail

    /// @brief Concurrent hash map with one spin lock per shard.
    ///
    /// Every operation touches exactly one shard, chosen from the high bits of the key hash
    /// (mixed, so that weak hashes still spread). Operations are linearizable per key. Size(),
    /// ForEach() and Clear() visit shards one after another and are not atomic snapshots.
    ///
    /// Callbacks (factories, predicates, visitors) run while the shard is locked and must not
    /// call back into the same map.
    template<class Key,
             class Value,
             class Hash             = std::hash<Key>,
             class Equal            = std::equal_to<Key>,
             std::size_t ShardCount = 16>
    class StripedHashMap
    {
        static_assert(detail::IsPowerOfTwo(ShardCount), "ShardCount must be a power of two.");

    public:
        using key_type                         = Key;
        using mapped_type                      = Value;
        using hash_type                        = Hash;
        using key_equal                        = Equal;
        using size_type                        = std::size_t;
        static constexpr size_type kShardCount = ShardCount;

        StripedHashMap() = default;

        StripedHashMap(const StripedHashMap&)            = delete;
        StripedHashMap& operator=(const StripedHashMap&) = delete;

        /// @brief Return the value mapped to @p key, inserting `factory()` first if absent.
        template<class Factory>
        Value GetOrInsert(const Key& key, Factory&& factory)
        {
            const std::size_t hash  = m_hash(key);
            Shard&            shard = ShardFor(hash);
            std::lock_guard   guard(shard.lock);
            auto              it = shard.map.find(key);
            if (it == shard.map.end())
                it = shard.map.emplace(key, std::forward<Factory>(factory)()).first;
            return it->second;
        }

        /// @brief Insert or overwrite. Returns true if the key was new.
        bool Insert(const Key& key, Value value)
        {
            Shard&          shard = ShardFor(m_hash(key));
            std::lock_guard guard(shard.lock);
            auto [it, inserted] = shard.map.try_emplace(key, std::move(value));
            if (!inserted)
                it->second = std::move(value);
            return inserted;
        }

        bool TryGet(const Key& key, Value& outValue) const
        {
            Shard&          shard = ShardFor(m_hash(key));
            std::lock_guard guard(shard.lock);
            const auto      it = shard.map.find(key);
            if (it == shard.map.end())
                return false;
            outValue = it->second;
            return true;
        }

        [[nodiscard]] std::optional<Value> GetOptional(const Key& key) const
        {
            Shard&          shard = ShardFor(m_hash(key));
            std::lock_guard guard(shard.lock);
            const auto      it = shard.map.find(key);
            if (it == shard.map.end())
                return std::nullopt;
            return it->second;
        }

        [[nodiscard]] bool Contains(const Key& key) const
        {
            Shard&          shard = ShardFor(m_hash(key));
            std::lock_guard guard(shard.lock);
            return shard.map.find(key) != shard.map.end();
        }

        bool Remove(const Key& key)
        {
            Shard&          shard = ShardFor(m_hash(key));
            std::lock_guard guard(shard.lock);
            return shard.map.erase(key) != 0;
        }

        /// @brief Remove @p key only if `predicate(value)` holds for its current value.
        template<class Predicate>
        bool RemoveIf(const Key& key, Predicate&& predicate)
        {
            Shard&          shard = ShardFor(m_hash(key));
            std::lock_guard guard(shard.lock);
            const auto      it = shard.map.find(key);
            if (it == shard.map.end() || !std::forward<Predicate>(predicate)(std::as_const(it->second)))
                return false;
            shard.map.erase(it);
            return true;
        }

        [[nodiscard]] size_type Size() const
        {
            size_type total = 0;
            for (auto& shard: m_shards)
            {
                std::lock_guard guard(shard.lock);
                total += shard.map.size();
            }
            return total;
        }

        [[nodiscard]] bool Empty() const
        {
            return Size() == 0;
        }

        template<class Callback>
        void ForEach(Callback&& callback) const
        {
            for (auto& shard: m_shards)
            {
                std::lock_guard guard(shard.lock);
                for (const auto& [key, value]: shard.map)
                    callback(key, value);
            }
        }

        void Clear()
        {
            for (auto& shard: m_shards)
            {
                std::lock_guard guard(shard.lock);
                shard.map.clear();
            }
        }

    private:
        struct alignas(64) Shard
        {
            Sync::SpinLock                              lock;
            std::unordered_map<Key, Value, Hash, Equal> map;
        };

        [[nodiscard]] static size_type ShardIndex(std::size_t hash) noexcept
        {
            // Fibonacci mixing; the top bits select the shard.
            constexpr UInt64 kGolden = 0x9E3779B97F4A7C15ull;
            const UInt64     mixed   = static_cast<UInt64>(hash) * kGolden;
            if constexpr (ShardCount == 1)
                return 0;
            else
                return static_cast<size_type>(mixed >> (64 - std::countr_zero(ShardCount)));
        }

        [[nodiscard]] Shard& ShardFor(std::size_t hash) const noexcept
        {
            return m_shards[ShardIndex(hash)];
        }

        [[no_unique_address]] Hash m_hash {};
        mutable std::array<Shard, ShardCount> m_shards {};
    };
}// namespace Warden::Containers
