//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Encode runtime used by headers generated with derivec.
///
/// Provides the backend tags, the `Encode` and `TypeInfo` customization points
/// generated contracts specialize, builtin codecs for PostgreSQL (binary wire
/// format) and MySQL, and the PostgreSQL composite record encoder.
///
//===----------------------------------------------------------------------===//

#ifndef LLVMDERIVE_CPP_RUNTIME_HPP
#define LLVMDERIVE_CPP_RUNTIME_HPP

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace llvmderive::runtime
{

/// @brief Result of a nullable encode.
enum class IsNull
{
    /// @brief A value was written.
    No,

    /// @brief Nothing was written; the value is SQL NULL.
    Yes,
};

/// @brief PostgreSQL backend tag.
struct Postgres final
{
    using RawBuffer = std::vector<std::uint8_t>;

    /// @brief Composite values can be sent as binary records.
    static constexpr bool kSupportsRecords = true;
};

/// @brief MySQL backend tag.
struct MySql final
{
    using RawBuffer = std::vector<std::uint8_t>;

    static constexpr bool kSupportsRecords = false;
};

/// @brief Encode contract of `T` for backend `DB`; specialized per type.
template <typename T, typename DB>
struct Encode
{};

/// @brief Backend type identity of `T` for backend `DB`; specialized per type.
template <typename T, typename DB>
struct TypeInfo
{};

template <typename T, typename DB>
concept Encodable = requires(const T& value, typename DB::RawBuffer& buf) {
    { Encode<T, DB>::encode(value, buf) } -> std::same_as<void>;
    { Encode<T, DB>::encodeNullable(value, buf) } -> std::same_as<IsNull>;
    { Encode<T, DB>::sizeHint(value) } -> std::convertible_to<std::size_t>;
};

template <typename T, typename DB>
concept HasTypeInfo = requires {
    { TypeInfo<T, DB>::name } -> std::convertible_to<std::string_view>;
};

/// @brief Raised when an enumeration holds a value that names no variant.
class InvalidVariantError final : public std::logic_error
{
public:
    InvalidVariantError(std::string_view typeName, const std::int64_t value)
        : std::logic_error("invalid value " + std::to_string(value) + " for enumeration '" + std::string(typeName) +
                           "'")
    {
    }
};

[[noreturn]] inline void throwInvalidVariant(std::string_view typeName, const std::int64_t value)
{
    throw InvalidVariantError(typeName, value);
}

namespace detail
{

template <typename T>
auto toWireBits(const T value)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        return static_cast<std::uint8_t>(value ? 1U : 0U);
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        return std::bit_cast<std::conditional_t<sizeof(T) == 4U, std::uint32_t, std::uint64_t>>(value);
    }
    else
    {
        return static_cast<std::make_unsigned_t<T>>(value);
    }
}

template <typename U>
void appendBigEndian(std::vector<std::uint8_t>& buf, const U bits)
{
    for (std::size_t i = sizeof(U); i > 0U; --i)
    {
        buf.push_back(static_cast<std::uint8_t>(bits >> ((i - 1U) * 8U)));
    }
}

template <typename U>
void appendLittleEndian(std::vector<std::uint8_t>& buf, const U bits, const std::size_t width = sizeof(U))
{
    for (std::size_t i = 0; i < width; ++i)
    {
        buf.push_back(static_cast<std::uint8_t>(bits >> (i * 8U)));
    }
}

inline void patchBigEndian(std::vector<std::uint8_t>& buf, const std::size_t offset, const std::uint32_t bits)
{
    for (std::size_t i = 0; i < 4U; ++i)
    {
        buf[offset + i] = static_cast<std::uint8_t>(bits >> ((3U - i) * 8U));
    }
}

inline void appendBytes(std::vector<std::uint8_t>& buf, const void* data, const std::size_t size)
{
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    buf.insert(buf.end(), bytes, bytes + size);
}

/// @brief MySQL length-encoded integer.
inline void appendLengthEncoded(std::vector<std::uint8_t>& buf, const std::uint64_t length)
{
    if (length < 251U)
    {
        buf.push_back(static_cast<std::uint8_t>(length));
    }
    else if (length < (1ULL << 16U))
    {
        buf.push_back(0xFCU);
        appendLittleEndian(buf, length, 2U);
    }
    else if (length < (1ULL << 24U))
    {
        buf.push_back(0xFDU);
        appendLittleEndian(buf, length, 3U);
    }
    else
    {
        buf.push_back(0xFEU);
        appendLittleEndian(buf, length, 8U);
    }
}

inline std::size_t lengthEncodedSize(const std::uint64_t length)
{
    if (length < 251U)
    {
        return 1U;
    }
    if (length < (1ULL << 16U))
    {
        return 3U;
    }
    if (length < (1ULL << 24U))
    {
        return 4U;
    }
    return 9U;
}

template <typename T>
struct PgFixedWidth
{
    static void encode(const T& value, Postgres::RawBuffer& buf)
    {
        appendBigEndian(buf, toWireBits(value));
    }

    static IsNull encodeNullable(const T& value, Postgres::RawBuffer& buf)
    {
        encode(value, buf);
        return IsNull::No;
    }

    static std::size_t sizeHint(const T&)
    {
        return sizeof(toWireBits(T{}));
    }
};

template <typename T>
struct PgBytes
{
    static void encode(const T& value, Postgres::RawBuffer& buf)
    {
        appendBytes(buf, value.data(), value.size());
    }

    static IsNull encodeNullable(const T& value, Postgres::RawBuffer& buf)
    {
        encode(value, buf);
        return IsNull::No;
    }

    static std::size_t sizeHint(const T& value)
    {
        return value.size();
    }
};

template <typename T>
struct MySqlFixedWidth
{
    static void encode(const T& value, MySql::RawBuffer& buf)
    {
        appendLittleEndian(buf, toWireBits(value));
    }

    static IsNull encodeNullable(const T& value, MySql::RawBuffer& buf)
    {
        encode(value, buf);
        return IsNull::No;
    }

    static std::size_t sizeHint(const T&)
    {
        return sizeof(toWireBits(T{}));
    }
};

template <typename T>
struct MySqlBytes
{
    static void encode(const T& value, MySql::RawBuffer& buf)
    {
        appendLengthEncoded(buf, value.size());
        appendBytes(buf, value.data(), value.size());
    }

    static IsNull encodeNullable(const T& value, MySql::RawBuffer& buf)
    {
        encode(value, buf);
        return IsNull::No;
    }

    static std::size_t sizeHint(const T& value)
    {
        return lengthEncodedSize(value.size()) + value.size();
    }
};

}  // namespace detail

// PostgreSQL builtins.

template <>
struct Encode<bool, Postgres> : detail::PgFixedWidth<bool>
{};
template <>
struct Encode<std::int8_t, Postgres> : detail::PgFixedWidth<std::int8_t>
{};
template <>
struct Encode<std::int16_t, Postgres> : detail::PgFixedWidth<std::int16_t>
{};
template <>
struct Encode<std::int32_t, Postgres> : detail::PgFixedWidth<std::int32_t>
{};
template <>
struct Encode<std::int64_t, Postgres> : detail::PgFixedWidth<std::int64_t>
{};
template <>
struct Encode<std::uint32_t, Postgres> : detail::PgFixedWidth<std::uint32_t>
{};
template <>
struct Encode<float, Postgres> : detail::PgFixedWidth<float>
{};
template <>
struct Encode<double, Postgres> : detail::PgFixedWidth<double>
{};
template <>
struct Encode<std::string_view, Postgres> : detail::PgBytes<std::string_view>
{};
template <>
struct Encode<std::string, Postgres> : detail::PgBytes<std::string>
{};
template <>
struct Encode<std::vector<std::uint8_t>, Postgres> : detail::PgBytes<std::vector<std::uint8_t>>
{};

template <>
struct TypeInfo<bool, Postgres>
{
    static constexpr std::uint32_t    oid  = 16U;
    static constexpr std::string_view name = "bool";
};
template <>
struct TypeInfo<std::int8_t, Postgres>
{
    static constexpr std::uint32_t    oid  = 18U;
    static constexpr std::string_view name = "char";
};
template <>
struct TypeInfo<std::int16_t, Postgres>
{
    static constexpr std::uint32_t    oid  = 21U;
    static constexpr std::string_view name = "int2";
};
template <>
struct TypeInfo<std::int32_t, Postgres>
{
    static constexpr std::uint32_t    oid  = 23U;
    static constexpr std::string_view name = "int4";
};
template <>
struct TypeInfo<std::int64_t, Postgres>
{
    static constexpr std::uint32_t    oid  = 20U;
    static constexpr std::string_view name = "int8";
};
template <>
struct TypeInfo<std::uint32_t, Postgres>
{
    static constexpr std::uint32_t    oid  = 26U;
    static constexpr std::string_view name = "oid";
};
template <>
struct TypeInfo<float, Postgres>
{
    static constexpr std::uint32_t    oid  = 700U;
    static constexpr std::string_view name = "float4";
};
template <>
struct TypeInfo<double, Postgres>
{
    static constexpr std::uint32_t    oid  = 701U;
    static constexpr std::string_view name = "float8";
};
template <>
struct TypeInfo<std::string_view, Postgres>
{
    static constexpr std::uint32_t    oid  = 25U;
    static constexpr std::string_view name = "text";
};
template <>
struct TypeInfo<std::string, Postgres> : TypeInfo<std::string_view, Postgres>
{};
template <>
struct TypeInfo<std::vector<std::uint8_t>, Postgres>
{
    static constexpr std::uint32_t    oid  = 17U;
    static constexpr std::string_view name = "bytea";
};

// MySQL builtins.

template <>
struct Encode<bool, MySql> : detail::MySqlFixedWidth<bool>
{};
template <>
struct Encode<std::int8_t, MySql> : detail::MySqlFixedWidth<std::int8_t>
{};
template <>
struct Encode<std::int16_t, MySql> : detail::MySqlFixedWidth<std::int16_t>
{};
template <>
struct Encode<std::int32_t, MySql> : detail::MySqlFixedWidth<std::int32_t>
{};
template <>
struct Encode<std::int64_t, MySql> : detail::MySqlFixedWidth<std::int64_t>
{};
template <>
struct Encode<std::uint8_t, MySql> : detail::MySqlFixedWidth<std::uint8_t>
{};
template <>
struct Encode<std::uint16_t, MySql> : detail::MySqlFixedWidth<std::uint16_t>
{};
template <>
struct Encode<std::uint32_t, MySql> : detail::MySqlFixedWidth<std::uint32_t>
{};
template <>
struct Encode<std::uint64_t, MySql> : detail::MySqlFixedWidth<std::uint64_t>
{};
template <>
struct Encode<float, MySql> : detail::MySqlFixedWidth<float>
{};
template <>
struct Encode<double, MySql> : detail::MySqlFixedWidth<double>
{};
template <>
struct Encode<std::string_view, MySql> : detail::MySqlBytes<std::string_view>
{};
template <>
struct Encode<std::string, MySql> : detail::MySqlBytes<std::string>
{};
template <>
struct Encode<std::vector<std::uint8_t>, MySql> : detail::MySqlBytes<std::vector<std::uint8_t>>
{};

template <>
struct TypeInfo<bool, MySql>
{
    static constexpr std::string_view name = "BOOLEAN";
};
template <>
struct TypeInfo<std::int8_t, MySql>
{
    static constexpr std::string_view name = "TINYINT";
};
template <>
struct TypeInfo<std::int16_t, MySql>
{
    static constexpr std::string_view name = "SMALLINT";
};
template <>
struct TypeInfo<std::int32_t, MySql>
{
    static constexpr std::string_view name = "INT";
};
template <>
struct TypeInfo<std::int64_t, MySql>
{
    static constexpr std::string_view name = "BIGINT";
};
template <>
struct TypeInfo<std::uint8_t, MySql>
{
    static constexpr std::string_view name = "TINYINT UNSIGNED";
};
template <>
struct TypeInfo<std::uint16_t, MySql>
{
    static constexpr std::string_view name = "SMALLINT UNSIGNED";
};
template <>
struct TypeInfo<std::uint32_t, MySql>
{
    static constexpr std::string_view name = "INT UNSIGNED";
};
template <>
struct TypeInfo<std::uint64_t, MySql>
{
    static constexpr std::string_view name = "BIGINT UNSIGNED";
};
template <>
struct TypeInfo<float, MySql>
{
    static constexpr std::string_view name = "FLOAT";
};
template <>
struct TypeInfo<double, MySql>
{
    static constexpr std::string_view name = "DOUBLE";
};
template <>
struct TypeInfo<std::string_view, MySql>
{
    static constexpr std::string_view name = "TEXT";
};
template <>
struct TypeInfo<std::string, MySql> : TypeInfo<std::string_view, MySql>
{};
template <>
struct TypeInfo<std::vector<std::uint8_t>, MySql>
{
    static constexpr std::string_view name = "BLOB";
};

// Optional values encode as NULL when empty.

template <typename T, typename DB>
    requires Encodable<T, DB>
struct Encode<std::optional<T>, DB>
{
    static void encode(const std::optional<T>& value, typename DB::RawBuffer& buf)
    {
        if (value)
        {
            Encode<T, DB>::encode(*value, buf);
        }
    }

    static IsNull encodeNullable(const std::optional<T>& value, typename DB::RawBuffer& buf)
    {
        if (!value)
        {
            return IsNull::Yes;
        }
        return Encode<T, DB>::encodeNullable(*value, buf);
    }

    static std::size_t sizeHint(const std::optional<T>& value)
    {
        return value ? Encode<T, DB>::sizeHint(*value) : 0U;
    }
};

template <typename T, typename DB>
    requires HasTypeInfo<T, DB>
struct TypeInfo<std::optional<T>, DB> : TypeInfo<T, DB>
{};

/// @brief Per-field framing bytes of a PostgreSQL composite record (oid and length).
inline constexpr std::size_t kPgRecordFieldOverhead = 8U;

/// @brief Writes a PostgreSQL binary composite record.
///
/// Layout: field count (int4), then per field the type oid (uint4), the data
/// length (int4, -1 for NULL) and the data bytes. Fields whose type is known
/// only by name are written with oid 0; the caller patches the oid at bind time.
class PgRecordEncoder final
{
public:
    explicit PgRecordEncoder(Postgres::RawBuffer& buf)
        : buf_(buf)
        , countOffset_(buf.size())
    {
        detail::appendBigEndian(buf_, std::uint32_t{0});
    }

    template <typename T>
        requires Encodable<T, Postgres> && HasTypeInfo<T, Postgres>
    PgRecordEncoder& encode(const T& value)
    {
        detail::appendBigEndian(buf_, static_cast<std::uint32_t>(TypeInfo<T, Postgres>::oid));
        const std::size_t lengthOffset = buf_.size();
        detail::appendBigEndian(buf_, std::uint32_t{0});

        if (Encode<T, Postgres>::encodeNullable(value, buf_) == IsNull::Yes)
        {
            buf_.resize(lengthOffset + 4U);
            detail::patchBigEndian(buf_, lengthOffset, static_cast<std::uint32_t>(-1));
        }
        else
        {
            const std::size_t length = buf_.size() - lengthOffset - 4U;
            if (length > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()))
            {
                throw std::length_error("composite record field exceeds the int4 length limit");
            }
            detail::patchBigEndian(buf_, lengthOffset, static_cast<std::uint32_t>(length));
        }
        ++count_;
        return *this;
    }

    void finish()
    {
        detail::patchBigEndian(buf_, countOffset_, count_);
    }

    std::uint32_t fieldCount() const
    {
        return count_;
    }

private:
    Postgres::RawBuffer& buf_;
    std::size_t          countOffset_;
    std::uint32_t        count_{0};
};

}  // namespace llvmderive::runtime

#endif  // LLVMDERIVE_CPP_RUNTIME_HPP
