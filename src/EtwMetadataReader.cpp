// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include "EtwMetadataInternal.h"
#include <fmt/core.h>
#include <stdio.h>
#include <exception>

namespace EtwMetaInternal
{
    char const* const OperationEnumerateProviders = "TdhEnumerateProviders";
    char const* const OperationEnumerateEvents = "TdhEnumerateManifestProviderEvents";
    char const* const OperationGetEventInformation = "TdhGetManifestEventInformation";

    static void
    AppendCodePoint(
        std::string& output,
        char32_t ch)
    {
        if (ch < 0x80)
        {
            output.push_back(static_cast<char>(ch));
        }
        else if (ch < 0x800)
        {
            output.push_back(static_cast<char>(0xC0 | (ch >> 6)));
            output.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        }
        else if (ch < 0x10000)
        {
            output.push_back(static_cast<char>(0xE0 | (ch >> 12)));
            output.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        }
        else
        {
            output.push_back(static_cast<char>(0xF0 | (ch >> 18)));
            output.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        }
    }

    void
    AppendUtf16AsUtf8(
        std::string& output,
        char16_t const* pch,
        size_t cch) noexcept(false)
    {
        output.reserve(output.size() + cch);

        for (size_t i = 0; i != cch; i += 1)
        {
            char32_t ch = pch[i];
            if (ch >= 0xD800 && ch <= 0xDBFF)
            {
                char32_t const low = i + 1 != cch ? pch[i + 1] : 0;
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    ch = 0x10000 + ((ch - 0xD800) << 10) + (low - 0xDC00);
                    i += 1;
                }
                else
                {
                    ch = 0xFFFD; // Replacement character
                }
            }
            else if (ch >= 0xDC00 && ch <= 0xDFFF)
            {
                ch = 0xFFFD; // Replacement character
            }

            AppendCodePoint(output, ch);
        }
    }

    EtwMetaError
    ReadOffsetString(
        uint8_t const* pData,
        size_t cbData,
        size_t offset,
        std::string& value) noexcept(false)
    {
        EtwMetaError error;

        value.clear();

        if (offset > cbData)
        {
            error = EtwMetaError_StringOffsetOutOfBounds;
        }
        else
        {
            // The string may be unaligned, so collect code units bytewise.
            // A trailing odd byte cannot hold a code unit and ends the scan.
            std::u16string chars;
            for (size_t i = offset; cbData - i >= 2; i += 2)
            {
                char16_t const ch = static_cast<char16_t>(
                    pData[i] | (pData[i + 1] << 8));
                if (ch == 0)
                {
                    break;
                }

                chars.push_back(ch);
            }

            AppendUtf16AsUtf8(value, chars.data(), chars.size());
            error = EtwMetaError_Success;
        }

        return error;
    }

    void
    TrimTrailingSpaces(
        std::string& value) noexcept
    {
        size_t i = value.size();
        while (i != 0 && value[i - 1] == ' ')
        {
            i -= 1;
        }

        value.resize(i);
    }

    void
    ContractFailure(
        char const* szMessage,
        EtwMetaErrorInfo const& context) noexcept
    {
        try
        {
            fmt::print(stderr, "EtwMetadata contract failure: {} ({} provider {} event {}v{})\n",
                szMessage,
                context.Operation,
                context.ProviderGuid,
                context.EventId,
                context.EventVersion);
        }
        catch (std::exception const&)
        {
            fputs("EtwMetadata contract failure\n", stderr);
        }

        abort();
    }
}
// namespace EtwMetaInternal
