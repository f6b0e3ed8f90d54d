//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "derives.hpp"

namespace
{

using llvmderive::runtime::Encode;
using llvmderive::runtime::IsNull;
using llvmderive::runtime::Postgres;
using llvmderive::runtime::TypeInfo;
using Bytes = std::vector<std::uint8_t>;

static_assert(TypeInfo<fixtures::Transparent, Postgres>::oid == 23U);
static_assert(TypeInfo<fixtures::Weak, Postgres>::name == "int4");
static_assert(TypeInfo<fixtures::Strong, Postgres>::oid == 25U);
static_assert(TypeInfo<fixtures::Strong, Postgres>::name == "text");
static_assert(TypeInfo<fixtures::InventoryItem, Postgres>::name == "inventory_item");
static_assert(TypeInfo<fixtures::Tagged<std::int64_t>, Postgres>::oid == 20U);
static_assert(!llvmderive::runtime::Encodable<fixtures::Tagged<std::uint16_t>, Postgres>);

template <typename T>
Bytes encodePg(const T& value)
{
    Bytes buf;
    Encode<T, Postgres>::encode(value, buf);
    return buf;
}

void dumpBytes(const char* const label, const Bytes& data)
{
    std::fprintf(stderr, "%s (%zu):", label, data.size());
    for (const auto b : data)
    {
        std::fprintf(stderr, " %02X", b);
    }
    std::fprintf(stderr, "\n");
}

int expectBytes(const char* const name, const Bytes& got, const Bytes& expected)
{
    if (got == expected)
    {
        return 0;
    }
    std::fprintf(stderr, "%s mismatch\n", name);
    dumpBytes("  got", got);
    dumpBytes("  expected", expected);
    return 1;
}

std::uint32_t readBigEndian32(const Bytes& data, const std::size_t offset)
{
    return (static_cast<std::uint32_t>(data[offset]) << 24U) | (static_cast<std::uint32_t>(data[offset + 1U]) << 16U) |
           (static_cast<std::uint32_t>(data[offset + 2U]) << 8U) | static_cast<std::uint32_t>(data[offset + 3U]);
}

int runTransparentCases()
{
    int failures = 0;
    for (const std::int32_t value : {0, 23523, -1})
    {
        failures += expectBytes("transparent", encodePg(fixtures::Transparent{value}), encodePg(value));
    }
    if (Encode<fixtures::Transparent, Postgres>::sizeHint(fixtures::Transparent{5}) != 4U)
    {
        std::fprintf(stderr, "transparent size hint mismatch\n");
        ++failures;
    }
    return failures;
}

int runWeakEnumCases()
{
    int failures = 0;
    failures += expectBytes("weak One", encodePg(fixtures::Weak::One), {0, 0, 0, 0});
    failures += expectBytes("weak Two", encodePg(fixtures::Weak::Two), {0, 0, 0, 2});
    failures += expectBytes("weak Three", encodePg(fixtures::Weak::Three), {0, 0, 0, 4});
    return failures;
}

int runStrongEnumCases()
{
    int failures = 0;
    const struct
    {
        fixtures::Strong value;
        std::string_view label;
    } cases[] = {
        {fixtures::Strong::One, "one"},
        {fixtures::Strong::Two, "two"},
        {fixtures::Strong::Three, "four"},
    };
    for (const auto& c : cases)
    {
        failures += expectBytes("strong label", encodePg(c.value), Bytes(c.label.begin(), c.label.end()));
    }

    try
    {
        (void) encodePg(static_cast<fixtures::Strong>(9));
        std::fprintf(stderr, "undeclared strong enum value encoded without error\n");
        ++failures;
    }
    catch (const llvmderive::runtime::InvalidVariantError&)
    {
    }
    return failures;
}

int runRecordCases()
{
    int failures = 0;

    const fixtures::InventoryItem item{"fuzzy dice", 42, 199};
    const Bytes                   buf = encodePg(item);
    if (buf.size() < 4U || readBigEndian32(buf, 0) != 3U)
    {
        std::fprintf(stderr, "record field count mismatch\n");
        return failures + 1;
    }

    Bytes expected = {0, 0, 0, 3, 0, 0, 0, 25, 0, 0, 0, 10};
    expected.insert(expected.end(), item.name.begin(), item.name.end());
    const Bytes tail = {
        0, 0, 0, 23, 0, 0, 0, 4, 0, 0, 0, 42,                 // supplier_id
        0, 0, 0, 20, 0, 0, 0, 8, 0, 0, 0, 0, 0, 0, 0, 199,  // price
    };
    expected.insert(expected.end(), tail.begin(), tail.end());
    failures += expectBytes("inventory_item record", buf, expected);

    const std::size_t hint = Encode<fixtures::InventoryItem, Postgres>::sizeHint(item);
    if (hint != 3U * llvmderive::runtime::kPgRecordFieldOverhead + 10U + 4U + 8U)
    {
        std::fprintf(stderr, "record size hint mismatch: %zu\n", hint);
        ++failures;
    }

    const fixtures::InventoryItem sparse{"", std::nullopt, std::nullopt};
    const Bytes                   sparseBuf = encodePg(sparse);
    failures += expectBytes("sparse record",
                            sparseBuf,
                            {0,    0,    0,    3,    0, 0, 0, 25, 0, 0, 0, 0,  0, 0, 0, 23,
                             0xFF, 0xFF, 0xFF, 0xFF, 0, 0, 0, 20, 0xFF, 0xFF, 0xFF, 0xFF});

    const fixtures::Measurement measurement{fixtures::Strong::Three, fixtures::Transparent{7}, std::nullopt};
    Bytes                       nestedExpected = {0, 0, 0, 3, 0, 0, 0, 25, 0, 0, 0, 4, 'f', 'o', 'u', 'r',
                                                  0, 0, 0, 23, 0, 0, 0, 4, 0, 0, 0, 7,
                                                  0, 0, 0, 25, 0xFF, 0xFF, 0xFF, 0xFF};
    failures += expectBytes("measurement record", encodePg(measurement), nestedExpected);

    Bytes nullableBuf;
    if (Encode<fixtures::InventoryItem, Postgres>::encodeNullable(item, nullableBuf) != IsNull::No ||
        nullableBuf != buf)
    {
        std::fprintf(stderr, "record encodeNullable must match encode\n");
        ++failures;
    }
    return failures;
}

int runGenericCases()
{
    int failures = 0;

    Bytes                                               buf;
    const fixtures::Tagged<std::optional<std::int64_t>> empty{std::nullopt};
    if (Encode<fixtures::Tagged<std::optional<std::int64_t>>, Postgres>::encodeNullable(empty, buf) != IsNull::Yes ||
        !buf.empty())
    {
        std::fprintf(stderr, "generic wrapper must forward NULL\n");
        ++failures;
    }
    failures += expectBytes("generic wrapper", encodePg(fixtures::Tagged<std::string>{"kg"}), {'k', 'g'});
    return failures;
}

}  // namespace

int main()
{
    int failures = 0;
    failures += runTransparentCases();
    failures += runWeakEnumCases();
    failures += runStrongEnumCases();
    failures += runRecordCases();
    failures += runGenericCases();
    if (failures != 0)
    {
        std::fprintf(stderr, "encode parity: %d failure(s)\n", failures);
        return EXIT_FAILURE;
    }
    std::printf("encode parity passed\n");
    return EXIT_SUCCESS;
}
