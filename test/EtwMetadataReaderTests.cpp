// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <gtest/gtest.h>
#include "EtwMetadataTestSource.h"

using namespace EtwMetaInternal;
using namespace EtwMetaTest;

namespace
{
    struct Record8
    {
        uint32_t A;
        uint32_t B;
    };
}

TEST(NegotiateBuffer, AllocatesReportedSizeAndFills)
{
    Buffer<uint8_t> buffer;
    EtwMetaStatus status;
    unsigned calls = 0;

    auto error = NegotiateBuffer(buffer, [&](void* pBuffer, uint32_t* pcbBuffer) noexcept
    {
        calls += 1;
        if (pBuffer == nullptr)
        {
            *pcbBuffer = 10;
            return EtwMetaStatus_InsufficientBuffer;
        }

        EXPECT_EQ(10u, *pcbBuffer);
        memset(pBuffer, 0xAB, *pcbBuffer);
        return EtwMetaStatus_Success;
    }, &status);

    EXPECT_EQ(EtwMetaError_Success, error);
    EXPECT_EQ(EtwMetaStatus_Success, status);
    EXPECT_EQ(2u, calls);
    ASSERT_EQ(10u, buffer.size());
    EXPECT_EQ(0xAB, buffer.data()[9]);
}

TEST(NegotiateBuffer, SuccessInSizePhaseIsAnError)
{
    Buffer<uint8_t> buffer;
    EtwMetaStatus status;

    auto error = NegotiateBuffer(buffer, [](void*, uint32_t* pcbBuffer) noexcept
    {
        *pcbBuffer = 0;
        return EtwMetaStatus_Success;
    }, &status);

    EXPECT_EQ(EtwMetaError_SizeQueryFailed, error);
    EXPECT_EQ(EtwMetaStatus_Success, status);
}

TEST(NegotiateBuffer, SizePhaseFailureKeepsStatus)
{
    Buffer<uint8_t> buffer;
    EtwMetaStatus status;

    auto error = NegotiateBuffer(buffer, [](void*, uint32_t*) noexcept
    {
        return EtwMetaStatus(1168);
    }, &status);

    EXPECT_EQ(EtwMetaError_SizeQueryFailed, error);
    EXPECT_EQ(1168u, status);
}

TEST(NegotiateBuffer, FillPhaseFailure)
{
    Buffer<uint8_t> buffer;
    EtwMetaStatus status;

    auto error = NegotiateBuffer(buffer, [](void* pBuffer, uint32_t* pcbBuffer) noexcept
    {
        if (pBuffer == nullptr)
        {
            *pcbBuffer = 16;
            return EtwMetaStatus_InsufficientBuffer;
        }

        return EtwMetaStatus_InsufficientBuffer;
    }, &status);

    EXPECT_EQ(EtwMetaError_FillFailed, error);
    EXPECT_EQ(EtwMetaStatus_InsufficientBuffer, status);
    EXPECT_EQ(0u, buffer.size());
}

TEST(NegotiateBuffer, ShrinksToFilledSize)
{
    Buffer<uint8_t> buffer;
    EtwMetaStatus status;

    auto error = NegotiateBuffer(buffer, [](void* pBuffer, uint32_t* pcbBuffer) noexcept
    {
        *pcbBuffer = pBuffer == nullptr ? 32 : 20;
        return pBuffer == nullptr
            ? EtwMetaStatus_InsufficientBuffer
            : EtwMetaStatus_Success;
    }, &status);

    EXPECT_EQ(EtwMetaError_Success, error);
    EXPECT_EQ(20u, buffer.size());
}

TEST(RecordArrayReader, ConsumesExactExtent)
{
    uint8_t data[8 + 3 * sizeof(Record8)] = {};
    data[8] = 1;
    data[16] = 2;
    data[24] = 3;

    RecordArrayReader<Record8> reader;
    ASSERT_EQ(EtwMetaError_Success, reader.Init(data, sizeof(data), 8, 3));
    EXPECT_EQ(3u, reader.Count());
    EXPECT_EQ(sizeof(data), reader.EndOffset());

    Record8 record;
    std::vector<uint32_t> values;
    while (reader.MoveNext(&record))
    {
        values.push_back(record.A);
    }

    EXPECT_EQ((std::vector<uint32_t>{ 1, 2, 3 }), values);
}

TEST(RecordArrayReader, CountPastEndYieldsNoRecords)
{
    // Room for 4 records, header claims 5.
    uint8_t data[4 * sizeof(Record8)] = {};

    RecordArrayReader<Record8> reader;
    EXPECT_EQ(EtwMetaError_ArrayOutOfBounds, reader.Init(data, sizeof(data), 0, 5));
    EXPECT_EQ(0u, reader.Count());

    Record8 record;
    EXPECT_FALSE(reader.MoveNext(&record));
}

TEST(RecordArrayReader, OffsetPastEnd)
{
    uint8_t data[16] = {};

    RecordArrayReader<Record8> reader;
    EXPECT_EQ(EtwMetaError_ArrayOutOfBounds, reader.Init(data, sizeof(data), 17, 0));
    EXPECT_EQ(EtwMetaError_Success, reader.Init(data, sizeof(data), 16, 0));
}

TEST(RecordArrayReader, HugeCountDoesNotWrap)
{
    uint8_t data[16] = {};

    RecordArrayReader<Record8> reader;
    EXPECT_EQ(EtwMetaError_ArrayOutOfBounds, reader.Init(data, sizeof(data), 8, 0xFFFFFFFF));
}

TEST(ReadOffsetString, ReadsToNul)
{
    MetaBufferBuilder builder;
    builder.AppendString(u"skip");
    size_t const offset = builder.AppendString(u"Hello");
    auto const& bytes = builder.Bytes();

    std::string value;
    ASSERT_EQ(EtwMetaError_Success, ReadOffsetString(bytes.data(), bytes.size(), offset, value));
    EXPECT_EQ("Hello", value);
}

TEST(ReadOffsetString, OffsetBounds)
{
    uint8_t const data[4] = { 'A', 0, 0, 0 };
    std::string value = "old";

    // Offset equal to the length is in bounds and reads an empty string.
    EXPECT_EQ(EtwMetaError_Success, ReadOffsetString(data, sizeof(data), 4, value));
    EXPECT_EQ("", value);

    EXPECT_EQ(EtwMetaError_StringOffsetOutOfBounds, ReadOffsetString(data, sizeof(data), 5, value));
}

TEST(ReadOffsetString, UnterminatedStopsAtEnd)
{
    // "AB" without a terminator, plus an odd trailing byte.
    uint8_t const data[5] = { 'A', 0, 'B', 0, 'C' };
    std::string value;

    EXPECT_EQ(EtwMetaError_Success, ReadOffsetString(data, sizeof(data), 0, value));
    EXPECT_EQ("AB", value);
}

TEST(ReadOffsetString, UnalignedOffset)
{
    uint8_t const data[7] = { 0xFF, 'x', 0, 'y', 0, 0, 0 };
    std::string value;

    EXPECT_EQ(EtwMetaError_Success, ReadOffsetString(data, sizeof(data), 1, value));
    EXPECT_EQ("xy", value);
}

TEST(AppendUtf16AsUtf8, ConvertsAndReplacesUnpairedSurrogates)
{
    std::string value;
    std::u16string const text = u"\u00E9\u4E2D\U0001F600";
    AppendUtf16AsUtf8(value, text.data(), text.size());
    EXPECT_EQ("\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80", value);

    value.clear();
    char16_t const unpaired[] = { u'a', 0xD800, u'b', 0xDC00 };
    AppendUtf16AsUtf8(value, unpaired, 4);
    EXPECT_EQ("a\xEF\xBF\xBD" "b\xEF\xBF\xBD", value);
}

TEST(TrimTrailingSpaces, RemovesOnlyTrailingSpaces)
{
    std::string value = " Task  ";
    TrimTrailingSpaces(value);
    EXPECT_EQ(" Task", value);

    value = "   ";
    TrimTrailingSpaces(value);
    EXPECT_EQ("", value);
}
