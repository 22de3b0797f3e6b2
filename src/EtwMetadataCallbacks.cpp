// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <EtwMetadata.h>

#ifdef _WIN32

#include <windows.h>
#include <tdh.h>

static_assert(EtwMetaStatus_Success == ERROR_SUCCESS, "Status must match Win32 error code.");
static_assert(EtwMetaStatus_NotSupported == ERROR_NOT_SUPPORTED, "Status must match Win32 error code.");
static_assert(EtwMetaStatus_InsufficientBuffer == ERROR_INSUFFICIENT_BUFFER, "Status must match Win32 error code.");
static_assert(sizeof(EtwGuid) == sizeof(GUID), "EtwGuid must match GUID.");
static_assert(sizeof(EtwEventDescriptor) == sizeof(EVENT_DESCRIPTOR), "EtwEventDescriptor must match EVENT_DESCRIPTOR.");

// TDH takes non-const GUID/descriptor pointers but does not modify them.
static GUID*
AsGuid(EtwGuid const& guid) noexcept
{
    return reinterpret_cast<GUID*>(const_cast<EtwGuid*>(&guid));
}

EtwMetaStatus
EtwMetadataCallbacks::EnumerateProviders(
    void* pBuffer,
    uint32_t* pcbBuffer) noexcept
{
    ULONG cbBuffer = *pcbBuffer;
    ULONG status = TdhEnumerateProviders(
        static_cast<PROVIDER_ENUMERATION_INFO*>(pBuffer),
        &cbBuffer);
    *pcbBuffer = cbBuffer;
    return status;
}

EtwMetaStatus
EtwMetadataCallbacks::EnumerateManifestProviderEvents(
    EtwGuid const& providerGuid,
    void* pBuffer,
    uint32_t* pcbBuffer) noexcept
{
    ULONG cbBuffer = *pcbBuffer;
    ULONG status = TdhEnumerateManifestProviderEvents(
        AsGuid(providerGuid),
        static_cast<PROVIDER_EVENT_INFO*>(pBuffer),
        &cbBuffer);
    *pcbBuffer = cbBuffer;
    return status;
}

EtwMetaStatus
EtwMetadataCallbacks::GetManifestEventInformation(
    EtwGuid const& providerGuid,
    EtwEventDescriptor const& eventDescriptor,
    void* pBuffer,
    uint32_t* pcbBuffer) noexcept
{
    ULONG cbBuffer = *pcbBuffer;
    ULONG status = TdhGetManifestEventInformation(
        AsGuid(providerGuid),
        reinterpret_cast<EVENT_DESCRIPTOR*>(const_cast<EtwEventDescriptor*>(&eventDescriptor)),
        static_cast<TRACE_EVENT_INFO*>(pBuffer),
        &cbBuffer);
    *pcbBuffer = cbBuffer;
    return status;
}

#else // _WIN32

/*
No TDH on this platform. The default callbacks report NotSupported, so
operations of a default-constructed decoder fail with SizeQueryFailed.
*/

EtwMetaStatus
EtwMetadataCallbacks::EnumerateProviders(
    void* pBuffer,
    uint32_t* pcbBuffer) noexcept
{
    (void)pBuffer;
    (void)pcbBuffer;
    return EtwMetaStatus_NotSupported;
}

EtwMetaStatus
EtwMetadataCallbacks::EnumerateManifestProviderEvents(
    EtwGuid const& providerGuid,
    void* pBuffer,
    uint32_t* pcbBuffer) noexcept
{
    (void)providerGuid;
    (void)pBuffer;
    (void)pcbBuffer;
    return EtwMetaStatus_NotSupported;
}

EtwMetaStatus
EtwMetadataCallbacks::GetManifestEventInformation(
    EtwGuid const& providerGuid,
    EtwEventDescriptor const& eventDescriptor,
    void* pBuffer,
    uint32_t* pcbBuffer) noexcept
{
    (void)providerGuid;
    (void)eventDescriptor;
    (void)pBuffer;
    (void)pcbBuffer;
    return EtwMetaStatus_NotSupported;
}

#endif // _WIN32
