// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

/*
Internal definitions shared by the EtwMetadata sources: the layout of the
records in TDH metadata buffers and the primitives used to read them.
*/

#pragma once
#include <EtwMetadata.h>
#include "EtwBuffer.inl"

#ifdef NDEBUG
#define ETWMETA_DEBUG_PRINTF(...) ((void)0)
#else // NDEBUG
#include <fmt/core.h>
#define ETWMETA_DEBUG_PRINTF(...) fmt::print(stderr, __VA_ARGS__)
#endif // NDEBUG

namespace EtwMetaInternal
{
    // Operation names, as reported in EtwMetaErrorInfo::Operation.
    extern char const* const OperationEnumerateProviders;
    extern char const* const OperationEnumerateEvents;
    extern char const* const OperationGetEventInformation;

    // PROPERTY_FLAGS
    enum PropertyFlags : uint32_t
    {
        PropertyStruct = 0x1,
        PropertyParamLength = 0x2,
        PropertyParamCount = 0x4,
        PropertyWBEMXmlFragment = 0x8,
        PropertyParamFixedLength = 0x10,
        PropertyParamFixedCount = 0x20,
        PropertyHasTags = 0x40,
        PropertyHasCustomSchema = 0x80,
    };

    // Prefix of PROVIDER_ENUMERATION_INFO and PROVIDER_EVENT_INFO.
    // The record array follows immediately.
    struct RawArrayHeader
    {
        uint32_t Count;
        uint32_t Reserved;
    };

    // TRACE_PROVIDER_INFO
    struct RawProviderInfo
    {
        EtwGuid ProviderGuid;
        uint32_t SchemaSource;
        uint32_t ProviderNameOffset;
    };

    // TRACE_EVENT_INFO without the trailing EventPropertyInfoArray.
    struct RawTraceEventInfo
    {
        EtwGuid ProviderGuid;
        EtwGuid EventGuid;
        EtwEventDescriptor EventDescriptor;
        uint32_t DecodingSource;
        uint32_t ProviderNameOffset;
        uint32_t LevelNameOffset;
        uint32_t ChannelNameOffset;
        uint32_t KeywordsNameOffset;
        uint32_t TaskNameOffset;
        uint32_t OpcodeNameOffset;
        uint32_t EventMessageOffset;
        uint32_t ProviderMessageOffset;
        uint32_t BinaryXMLOffset;
        uint32_t BinaryXMLSize;
        uint32_t EventNameOffset;       // ActivityIDNameOffset for WBEM.
        uint32_t EventAttributesOffset; // RelatedActivityIDNameOffset for WBEM.
        uint32_t PropertyCount;
        uint32_t TopLevelPropertyCount;
        uint32_t Flags;
    };

    // EVENT_PROPERTY_INFO (non-struct view of the union).
    struct RawEventPropertyInfo
    {
        uint32_t Flags;
        uint32_t NameOffset;
        uint16_t InType;
        uint16_t OutType;
        uint32_t MapNameOffset;
        uint16_t Count;     // countPropertyIndex if PropertyParamCount.
        uint16_t Length;    // lengthPropertyIndex if PropertyParamLength.
        uint32_t Tags;
    };

    static_assert(sizeof(EtwGuid) == 16, "EtwGuid must match GUID.");
    static_assert(sizeof(EtwEventDescriptor) == 16, "EtwEventDescriptor must match EVENT_DESCRIPTOR.");
    static_assert(sizeof(RawArrayHeader) == 8, "RawArrayHeader size");
    static_assert(sizeof(RawProviderInfo) == 24, "RawProviderInfo must match TRACE_PROVIDER_INFO.");
    static_assert(sizeof(RawTraceEventInfo) == 112, "RawTraceEventInfo must match TRACE_EVENT_INFO.");
    static_assert(sizeof(RawEventPropertyInfo) == 24, "RawEventPropertyInfo must match EVENT_PROPERTY_INFO.");

    /*
    Runs the two-phase buffer protocol against query, which is invoked as
    query(void* pBuffer, uint32_t* pcbBuffer) and returns EtwMetaStatus.

    1. query(nullptr, &cb) must return InsufficientBuffer. Any other status
       (including Success) fails with SizeQueryFailed.
    2. buffer is resized to exactly cb bytes; allocation failure fails with
       OutOfMemory.
    3. query(buffer, &cb) must return Success, otherwise FillFailed. If the
       source reports that it used fewer bytes, buffer is shrunk to match.

    *pStatus receives the status of the last query.
    */
    template<class QueryFn>
    EtwMetaError
    NegotiateBuffer(
        Buffer<uint8_t>& buffer,
        QueryFn&& query,
        EtwMetaStatus* pStatus) noexcept
    {
        EtwMetaError error;
        uint32_t cbBuffer = 0;

        buffer.clear();

        *pStatus = query(static_cast<void*>(nullptr), &cbBuffer);
        if (*pStatus != EtwMetaStatus_InsufficientBuffer)
        {
            error = EtwMetaError_SizeQueryFailed;
        }
        else if (!buffer.resize(cbBuffer, false))
        {
            error = EtwMetaError_OutOfMemory;
        }
        else
        {
            uint32_t cbFilled = cbBuffer;
            *pStatus = query(static_cast<void*>(buffer.data()), &cbFilled);
            if (*pStatus != EtwMetaStatus_Success)
            {
                buffer.clear();
                error = EtwMetaError_FillFailed;
            }
            else
            {
                if (cbFilled < cbBuffer)
                {
                    buffer.resize_unchecked(cbFilled);
                }

                error = EtwMetaError_Success;
            }
        }

        return error;
    }

    /*
    Reads an array of Count() fixed-size records of type T.

    Init validates the whole extent of the array against the buffer before
    any record is read, so either all records are available or the caller
    gets ArrayOutOfBounds and no records. MoveNext copies the next record
    out of the buffer (the buffer need not be aligned).
    */
    template<class T>
    class RecordArrayReader
    {
    public:

        RecordArrayReader() noexcept
            : m_pNext()
            , m_remaining()
            , m_count()
            , m_endOffset()
        {
            return;
        }

        EtwMetaError Init(
            uint8_t const* pData,
            size_t cbData,
            size_t offset,
            uint32_t count) noexcept
        {
            EtwMetaError error;

            // 64-bit math: count * sizeof(T) cannot overflow.
            uint64_t const endOffset = static_cast<uint64_t>(offset) +
                static_cast<uint64_t>(count) * sizeof(T);
            if (offset > cbData || endOffset > cbData)
            {
                m_pNext = nullptr;
                m_remaining = 0;
                m_count = 0;
                m_endOffset = offset;
                error = EtwMetaError_ArrayOutOfBounds;
            }
            else
            {
                m_pNext = pData + offset;
                m_remaining = count;
                m_count = count;
                m_endOffset = static_cast<size_t>(endOffset);
                error = EtwMetaError_Success;
            }

            return error;
        }

        uint32_t Count() const noexcept
        {
            return m_count;
        }

        // Offset of the first byte after the array.
        size_t EndOffset() const noexcept
        {
            return m_endOffset;
        }

        // Returns false when all records have been read.
        bool MoveNext(T* pRecord) noexcept
        {
            bool moved;

            if (m_remaining == 0)
            {
                moved = false;
            }
            else
            {
                memcpy(pRecord, m_pNext, sizeof(T));
                m_pNext += sizeof(T);
                m_remaining -= 1;
                moved = true;
            }

            return moved;
        }

    private:

        uint8_t const* m_pNext;
        uint32_t m_remaining;
        uint32_t m_count;
        size_t m_endOffset;
    };

    /*
    Reads the nul-terminated UTF-16LE string that starts at byte offset
    within the buffer and stores it in value as UTF-8.

    Fails with StringOffsetOutOfBounds if offset > cbData. The scan stops at
    the nul or at the end of the buffer, whichever comes first.
    */
    EtwMetaError ReadOffsetString(
        uint8_t const* pData,
        size_t cbData,
        size_t offset,
        std::string& value) noexcept(false);

    /*
    Appends cch UTF-16 code units to output as UTF-8. Unpaired surrogates
    are converted to U+FFFD.
    */
    void AppendUtf16AsUtf8(
        std::string& output,
        char16_t const* pch,
        size_t cch) noexcept(false);

    // Removes trailing ' ' characters.
    void TrimTrailingSpaces(
        std::string& value) noexcept;

    /*
    Reports a violated invariant of the metadata source and terminates the
    process.
    */
    [[noreturn]] void ContractFailure(
        char const* szMessage,
        EtwMetaErrorInfo const& context) noexcept;
}
// namespace EtwMetaInternal
