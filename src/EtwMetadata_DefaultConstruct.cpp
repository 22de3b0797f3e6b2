// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <EtwMetadata.h>

/*
This is in a separate file so that if the user provides their own
implementation of EtwMetadataCallbacks they can avoid a dependency on
tdh.lib or DefaultCallbacksInstance.
*/

namespace EtwMetaInternal
{
    // EtwMetadataCallbacks used for default-constructed decoders and caches:
    struct DefaultCallbacks final : EtwMetadataCallbacks {};
}
// namespace EtwMetaInternal

using EtwMetaInternal::DefaultCallbacks;

// constexpr to avoid a dynamic initializer:
static constexpr DefaultCallbacks DefaultCallbacksInstance;

EtwMetadataDecoder::EtwMetadataDecoder() noexcept
    : EtwMetadataDecoder(const_cast<DefaultCallbacks&>(DefaultCallbacksInstance))
{
    return;
}

EtwMetadataCache::EtwMetadataCache() noexcept
    : EtwMetadataCache(const_cast<DefaultCallbacks&>(DefaultCallbacksInstance))
{
    return;
}
