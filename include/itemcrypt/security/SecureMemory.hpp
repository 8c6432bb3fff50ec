#ifndef INCLUDE_ITEMCRYPT_SECURITY_SECUREMEMORY_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SECUREMEMORY_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace itemcrypt::security
{

void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Allocator that wipes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& u) noexcept
    {
    }

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& t,
                          [[maybe_unused]] const ZeroAllocator<U>& u) noexcept
{
    return true;
}

using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Parentheses select the range constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

template <class Container> inline void secureRelease(Container& c) noexcept
{
    secureWipe(std::span{ c.data(), c.size() });
    Container temp{};
    c.swap(temp);
}

// Constant-time comparison; the size check itself is not secret.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<unsigned char>(std::to_integer<unsigned char>(a[i]) ^ std::to_integer<unsigned char>(b[i]));
    }
    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

private:
    std::span<std::byte> m_bytes;
};

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SECUREMEMORY_HPP
