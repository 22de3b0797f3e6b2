// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include "EtwMetadataInternal.h"
#include <fmt/format.h>
#include <iterator>

bool
operator==(EtwGuid const& a, EtwGuid const& b) noexcept
{
    return 0 == memcmp(&a, &b, sizeof(EtwGuid));
}

bool
operator!=(EtwGuid const& a, EtwGuid const& b) noexcept
{
    return !(a == b);
}

EtwTypeTag
EtwTypeTag::FromCode(uint16_t code) noexcept
{
    EtwTypeTag tag;
    tag.Kind = code <= EtwInType_Max
        ? EtwTypeTagKind_Known
        : EtwTypeTagKind_Raw;
    tag.Code = code;
    return tag;
}

bool
EtwTypeTag::IsKnown() const noexcept
{
    return Kind == EtwTypeTagKind_Known;
}

EtwInType
EtwTypeTag::KnownType() const noexcept
{
    assert(IsKnown());
    return static_cast<EtwInType>(Code);
}

bool
operator==(EtwTypeTag const& a, EtwTypeTag const& b) noexcept
{
    return a.Kind == b.Kind && a.Code == b.Code;
}

bool
EtwFieldSize::IsPresent() const noexcept
{
    return Kind != EtwFieldSizeKind_None;
}

// Returns the value of a hex digit, or -1.
static int
HexDigitValue(char ch) noexcept
{
    return
        ch >= '0' && ch <= '9' ? ch - '0' :
        ch >= 'a' && ch <= 'f' ? ch - 'a' + 10 :
        ch >= 'A' && ch <= 'F' ? ch - 'A' + 10 :
        -1;
}

// Parses cDigits hex digits at pch.
static bool
ParseHex(
    char const* pch,
    unsigned cDigits,
    uint64_t* pValue) noexcept
{
    uint64_t value = 0;
    for (unsigned i = 0; i != cDigits; i += 1)
    {
        int const digit = HexDigitValue(pch[i]);
        if (digit < 0)
        {
            return false;
        }

        value = (value << 4) | static_cast<unsigned>(digit);
    }

    *pValue = value;
    return true;
}

bool
EtwGuidFromString(
    std::string_view text,
    EtwGuid* pGuid) noexcept
{
    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    static unsigned const GuidChars = 36;

    bool ok;
    uint64_t data1, data2, data3, data4a, data4b;
    char const* pch;

    if (text.size() == GuidChars + 2 &&
        text.front() == '{' &&
        text.back() == '}')
    {
        text = text.substr(1, GuidChars);
    }

    pch = text.data();
    if (text.size() != GuidChars ||
        pch[8] != '-' || pch[13] != '-' || pch[18] != '-' || pch[23] != '-' ||
        !ParseHex(pch + 0, 8, &data1) ||
        !ParseHex(pch + 9, 4, &data2) ||
        !ParseHex(pch + 14, 4, &data3) ||
        !ParseHex(pch + 19, 4, &data4a) ||
        !ParseHex(pch + 24, 12, &data4b))
    {
        ok = false;
    }
    else
    {
        pGuid->Data1 = static_cast<uint32_t>(data1);
        pGuid->Data2 = static_cast<uint16_t>(data2);
        pGuid->Data3 = static_cast<uint16_t>(data3);
        pGuid->Data4[0] = static_cast<uint8_t>(data4a >> 8);
        pGuid->Data4[1] = static_cast<uint8_t>(data4a);
        for (unsigned i = 0; i != 6; i += 1)
        {
            pGuid->Data4[2 + i] = static_cast<uint8_t>(data4b >> (40 - 8 * i));
        }

        ok = true;
    }

    return ok;
}

std::string
EtwGuidToString(
    EtwGuid const& guid) noexcept(false)
{
    return fmt::format(
        "{{{:08x}-{:04x}-{:04x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}}}",
        guid.Data1, guid.Data2, guid.Data3,
        guid.Data4[0], guid.Data4[1], guid.Data4[2], guid.Data4[3],
        guid.Data4[4], guid.Data4[5], guid.Data4[6], guid.Data4[7]);
}

char const*
EtwMetaErrorName(EtwMetaError error) noexcept
{
    static char const* const Names[] = {
        "Success",
        "SizeQueryFailed",
        "FillFailed",
        "ArrayOutOfBounds",
        "StringOffsetOutOfBounds",
        "FieldIndexOutOfBounds",
        "UnknownSchemaSource",
        "InvalidGuid",
        "OutOfMemory",
    };
    static_assert(sizeof(Names) / sizeof(Names[0]) == EtwMetaError_Max, "Names");

    return error < EtwMetaError_Max ? Names[error] : "Unknown";
}

char const*
EtwSchemaSourceName(EtwSchemaSource schemaSource) noexcept
{
    static char const* const Names[] = {
        "XmlFile",
        "Wbem",
        "Wpp",
        "Tlg",
        "Unknown",
    };
    static_assert(sizeof(Names) / sizeof(Names[0]) == EtwSchemaSource_Max + 1, "Names");

    return schemaSource <= EtwSchemaSource_Max ? Names[schemaSource] : "Unknown";
}

char const*
EtwInTypeName(EtwInType inType) noexcept
{
    static char const* const Names[] = {
        "NULL",
        "UNICODESTRING",
        "ANSISTRING",
        "INT8",
        "UINT8",
        "INT16",
        "UINT16",
        "INT32",
        "UINT32",
        "INT64",
        "UINT64",
        "FLOAT",
        "DOUBLE",
        "BOOLEAN",
        "BINARY",
        "GUID",
        "POINTER",
        "FILETIME",
        "SYSTEMTIME",
        "SID",
        "HEXINT32",
        "HEXINT64",
        "MANIFEST_COUNTEDSTRING",
        "MANIFEST_COUNTEDANSISTRING",
        "RESERVED24",
        "MANIFEST_COUNTEDBINARY",
        "COUNTEDSTRING",
        "COUNTEDANSISTRING",
        "REVERSEDCOUNTEDSTRING",
        "REVERSEDCOUNTEDANSISTRING",
        "NONNULLTERMINATEDSTRING",
        "NONNULLTERMINATEDANSISTRING",
        "UNICODECHAR",
        "ANSICHAR",
        "SIZET",
        "HEXDUMP",
        "WBEMSID",
    };
    static_assert(sizeof(Names) / sizeof(Names[0]) == EtwInType_Max + 1, "Names");

    return inType <= EtwInType_Max ? Names[inType] : "";
}

std::string
EtwMetaFormatError(
    EtwMetaErrorInfo const& errorInfo) noexcept(false)
{
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    if (errorInfo.Error == EtwMetaError_Success)
    {
        fmt::format_to(it, "{} succeeded", errorInfo.Operation);
    }
    else
    {
        fmt::format_to(it, "{} failed: {}",
            errorInfo.Operation,
            EtwMetaErrorName(errorInfo.Error));

        switch (errorInfo.Error)
        {
        case EtwMetaError_SizeQueryFailed:
        case EtwMetaError_FillFailed:
            fmt::format_to(it, " (status {})", errorInfo.Status);
            break;
        case EtwMetaError_InvalidGuid:
            break;
        default:
            fmt::format_to(it, " (value {})", errorInfo.Value);
            break;
        }
    }

    if (!errorInfo.ProviderGuid.empty())
    {
        fmt::format_to(it, ", provider {}", errorInfo.ProviderGuid);
    }

    if (errorInfo.HasEvent)
    {
        fmt::format_to(it, ", event {}v{}", errorInfo.EventId, errorInfo.EventVersion);
    }

    return fmt::to_string(out);
}
