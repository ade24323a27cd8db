#include <Warden/Sync/LockKey.hpp>

#include <iterator>

#include <fmt/format.h>

namespace Warden::Sync
{
    namespace
    {
        template<typename... Fs>
        struct Overloaded : Fs...
        {
            using Fs::operator()...;
        };
        template<typename... Fs>
        Overloaded(Fs...) -> Overloaded<Fs...>;
    }// namespace

    UIntSize KeyValue::Hash() const noexcept
    {
        const UIntSize payload = std::visit(
                Overloaded {
                        [](std::monostate) noexcept -> UIntSize { return 0; },
                        [](bool v) noexcept -> UIntSize { return v ? 1231 : 1237; },
                        [](Int64 v) noexcept -> UIntSize { return std::hash<Int64> {}(v); },
                        [](UInt64 v) noexcept -> UIntSize { return std::hash<UInt64> {}(v); },
                        [](F64 v) noexcept -> UIntSize { return std::hash<UInt64> {}(std::bit_cast<UInt64>(v)); },
                        [](const std::string& v) noexcept -> UIntSize { return std::hash<std::string_view> {}(v); },
                        [](IdentityToken v) noexcept -> UIntSize { return std::hash<const void*> {}(v.address); },
                },
                m_storage);
        return payload * 31u + m_storage.index();
    }

    std::string KeyValue::ToString() const
    {
        return std::visit(
                Overloaded {
                        [](std::monostate) -> std::string { return "null"; },
                        [](bool v) -> std::string { return v ? "true" : "false"; },
                        [](Int64 v) -> std::string { return fmt::format("{}", v); },
                        [](UInt64 v) -> std::string { return fmt::format("{}", v); },
                        [](F64 v) -> std::string { return fmt::format("{}", v); },
                        [](const std::string& v) -> std::string { return v; },
                        [](IdentityToken v) -> std::string { return fmt::format("@{}", fmt::ptr(v.address)); },
                },
                m_storage);
    }

    LockKey::LockKey(Kind kind, std::vector<KeyValue> values)
        : m_kind(kind)
        , m_values(std::move(values))
    {
        UIntSize hash = m_kind == Kind::Single ? 17u : 19u;
        for (const auto& value: m_values)
            hash = hash * 31u + value.Hash();
        m_hash = hash;
    }

    std::string LockKey::ToString() const
    {
        if (IsSingle())
            return m_values.front().ToString();

        fmt::memory_buffer buffer;
        buffer.push_back('[');
        for (UIntSize i = 0; i < m_values.size(); ++i)
        {
            if (i != 0)
                fmt::format_to(std::back_inserter(buffer), ", ");
            fmt::format_to(std::back_inserter(buffer), "{}", m_values[i].ToString());
        }
        buffer.push_back(']');
        return fmt::to_string(buffer);
    }
}// namespace Warden::Sync
