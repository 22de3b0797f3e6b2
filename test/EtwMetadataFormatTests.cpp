// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <gtest/gtest.h>
#include <EtwMetadata.h>

TEST(EtwGuidText, ParsesBracedAndBareInAnyCase)
{
    EtwGuid a, b;
    ASSERT_TRUE(EtwGuidFromString("{22FB2CD6-0E7B-422B-A0C7-2FAD1FD0E716}", &a));
    ASSERT_TRUE(EtwGuidFromString("22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716", &b));
    EXPECT_EQ(a, b);

    EXPECT_EQ(0x22fb2cd6u, a.Data1);
    EXPECT_EQ(0x0e7bu, a.Data2);
    EXPECT_EQ(0x422bu, a.Data3);
    EXPECT_EQ(0xa0u, a.Data4[0]);
    EXPECT_EQ(0xc7u, a.Data4[1]);
    EXPECT_EQ(0x2fu, a.Data4[2]);
    EXPECT_EQ(0x16u, a.Data4[7]);
}

TEST(EtwGuidText, RejectsMalformedText)
{
    EtwGuid guid;
    EXPECT_FALSE(EtwGuidFromString("", &guid));
    EXPECT_FALSE(EtwGuidFromString("{}", &guid));
    EXPECT_FALSE(EtwGuidFromString("{22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716", &guid));
    EXPECT_FALSE(EtwGuidFromString("22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716}", &guid));
    EXPECT_FALSE(EtwGuidFromString("22fb2cd6x0e7b-422b-a0c7-2fad1fd0e716", &guid));
    EXPECT_FALSE(EtwGuidFromString("22fb2cd6-0e7b-422b-a0c7-2fad1fd0e71g", &guid));
    EXPECT_FALSE(EtwGuidFromString("22fb2cd60e7b422ba0c72fad1fd0e716", &guid));
}

TEST(EtwGuidText, FormatsLowercaseBraced)
{
    EtwGuid guid;
    ASSERT_TRUE(EtwGuidFromString("9E814AAD-3204-11D2-9A82-006008A86939", &guid));
    EXPECT_EQ("{9e814aad-3204-11d2-9a82-006008a86939}", EtwGuidToString(guid));

    EtwGuid const zero = {};
    EXPECT_EQ("{00000000-0000-0000-0000-000000000000}", EtwGuidToString(zero));
}

TEST(EtwTypeTag, KnownRangeEndsAtWbemSid)
{
    EXPECT_TRUE(EtwTypeTag::FromCode(0).IsKnown());
    EXPECT_TRUE(EtwTypeTag::FromCode(36).IsKnown());
    EXPECT_EQ(EtwInType_WbemSid, EtwTypeTag::FromCode(36).KnownType());

    auto raw = EtwTypeTag::FromCode(37);
    EXPECT_FALSE(raw.IsKnown());
    EXPECT_EQ(EtwTypeTagKind_Raw, raw.Kind);
    EXPECT_EQ(37u, raw.Code);
    EXPECT_TRUE(raw == EtwTypeTag::FromCode(37));
}

TEST(EtwMetaNames, Names)
{
    EXPECT_STREQ("ArrayOutOfBounds", EtwMetaErrorName(EtwMetaError_ArrayOutOfBounds));
    EXPECT_STREQ("OutOfMemory", EtwMetaErrorName(EtwMetaError_OutOfMemory));
    EXPECT_STREQ("Tlg", EtwSchemaSourceName(EtwSchemaSource_Tlg));
    EXPECT_STREQ("Unknown", EtwSchemaSourceName(EtwSchemaSource_Unknown));
    EXPECT_STREQ("UNICODESTRING", EtwInTypeName(EtwInType_UnicodeString));
    EXPECT_STREQ("WBEMSID", EtwInTypeName(EtwInType_WbemSid));
    EXPECT_STREQ("", EtwInTypeName(static_cast<EtwInType>(200)));
}

TEST(EtwMetaFormatError, IncludesContext)
{
    EtwMetaErrorInfo info;
    info.Error = EtwMetaError_FieldIndexOutOfBounds;
    info.Operation = "TdhGetManifestEventInformation";
    info.ProviderGuid = "{22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716}";
    info.HasEvent = true;
    info.EventId = 10;
    info.EventVersion = 1;
    info.Value = 3;

    EXPECT_EQ(
        "TdhGetManifestEventInformation failed: FieldIndexOutOfBounds (value 3), "
        "provider {22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716}, event 10v1",
        EtwMetaFormatError(info));
}

TEST(EtwMetaFormatError, NegotiationErrorsShowStatus)
{
    EtwMetaErrorInfo info;
    info.Error = EtwMetaError_SizeQueryFailed;
    info.Status = 5;
    info.Operation = "TdhEnumerateProviders";

    EXPECT_EQ("TdhEnumerateProviders failed: SizeQueryFailed (status 5)", EtwMetaFormatError(info));
}
