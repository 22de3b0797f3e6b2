// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include "EtwMetadataInternal.h"
#include <utility>

using namespace EtwMetaInternal;

template<class T>
static void
SetResult(
    EtwMetaResult<T>& result,
    bool succeeded,
    T&& value,
    EtwMetaErrorInfo const& errorInfo) noexcept(false)
{
    if (succeeded)
    {
        result.Value = std::make_shared<T>(std::move(value));
    }
    else
    {
        result.Error = std::make_shared<EtwMetaErrorInfo>(errorInfo);
    }
}

EtwMetadataCache::~EtwMetadataCache()
{
    return;
}

EtwMetadataCache::EtwMetadataCache(
    EtwMetadataCallbacks& callbacks) noexcept
    : m_callbacks(callbacks)
    , m_eventsMutex()
    , m_providers()
    , m_eventsByProvider()
{
    return;
}

EtwProvidersResult
EtwMetadataCache::GetProviders() noexcept(false)
{
    // If the computation throws, the flag stays unset and the next caller
    // tries again.
    std::call_once(m_providers.Once, [this]()
    {
        ETWMETA_DEBUG_PRINTF("EtwMetadataCache: enumerating providers\n");

        EtwMetadataDecoder decoder(m_callbacks);
        std::vector<EtwProviderInfo> providers;
        bool const succeeded = decoder.EnumerateProviders(providers);
        SetResult(m_providers.Result, succeeded, std::move(providers), decoder.LastError());
    });

    return m_providers.Result;
}

EtwEventsResult
EtwMetadataCache::GetProviderEvents(
    std::string_view providerGuid) noexcept(false)
{
    EtwEventsResult result;
    EtwGuid guid;

    if (!EtwGuidFromString(providerGuid, &guid))
    {
        auto errorInfo = std::make_shared<EtwMetaErrorInfo>();
        errorInfo->Error = EtwMetaError_InvalidGuid;
        errorInfo->Operation = OperationEnumerateEvents;
        errorInfo->ProviderGuid = std::string(providerGuid);
        result.Error = std::move(errorInfo);
    }
    else
    {
        std::string key = EtwGuidToString(guid);
        std::shared_ptr<EventsEntry> entry;

        {
            std::lock_guard<std::mutex> lock(m_eventsMutex);
            auto it = m_eventsByProvider.find(key);
            if (it == m_eventsByProvider.end())
            {
                it = m_eventsByProvider.emplace(std::move(key), std::make_shared<EventsEntry>()).first;
            }

            entry = it->second;
        }

        // The map lock is not held here, so computing one provider does not
        // block lookups of other providers.
        std::call_once(entry->Once, [this, &entry, &guid]()
        {
            ETWMETA_DEBUG_PRINTF("EtwMetadataCache: enumerating events of {}\n", EtwGuidToString(guid));

            EtwMetadataDecoder decoder(m_callbacks);
            std::vector<EtwEventSchema> events;
            bool const succeeded = decoder.GetProviderEvents(guid, events);
            SetResult(entry->Result, succeeded, std::move(events), decoder.LastError());
        });

        result = entry->Result;
    }

    return result;
}

size_t
EtwMetadataCache::ProviderEventsEntryCount() const noexcept
{
    std::lock_guard<std::mutex> lock(m_eventsMutex);
    return m_eventsByProvider.size();
}
