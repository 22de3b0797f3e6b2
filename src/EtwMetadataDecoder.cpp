// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include "EtwMetadataInternal.h"
#include <utility>

using namespace EtwMetaInternal;

/*
Resolves the length or count of a field from the flags of its property
record. fixedFlag selects a literal value, paramFlag selects a reference to
an earlier field by index. Only fields already in 'fields' can be
referenced.
*/
static EtwMetaError
ResolveFieldSize(
    uint32_t flags,
    uint32_t fixedFlag,
    uint32_t paramFlag,
    uint16_t rawValue,
    std::vector<EtwFieldSchema> const& fields,
    EtwFieldSize& size) noexcept(false)
{
    EtwMetaError error = EtwMetaError_Success;

    if (flags & fixedFlag)
    {
        size.Kind = EtwFieldSizeKind_Literal;
        size.Value = rawValue;
    }
    else if (flags & paramFlag)
    {
        if (static_cast<size_t>(rawValue) >= fields.size())
        {
            error = EtwMetaError_FieldIndexOutOfBounds;
        }
        else
        {
            size.Kind = EtwFieldSizeKind_Reference;
            size.Value = rawValue;
            size.FieldName = fields[rawValue].Name;
        }
    }

    return error;
}

EtwMetadataDecoder::~EtwMetadataDecoder()
{
    // Can't use the compiler-generated destructor because it leads to a link
    // error (missing definition of the destructor for Buffer).
    return;
}

EtwMetadataDecoder::EtwMetadataDecoder(
    EtwMetadataCallbacks& callbacks) noexcept
    : m_callbacks(callbacks)
    , m_lastError()
    , m_enumerationBuffer()
    , m_eventInfoBuffer()
{
    return;
}

EtwMetaErrorInfo const&
EtwMetadataDecoder::LastError() const noexcept
{
    return m_lastError;
}

bool
EtwMetadataDecoder::EnumerateProviders(
    std::vector<EtwProviderInfo>& providers) noexcept(false)
{
    bool succeeded;
    std::vector<EtwProviderInfo> decoded;

    providers.clear();
    StartOperation(OperationEnumerateProviders, std::string());

    auto query = [this](void* pBuffer, uint32_t* pcbBuffer) noexcept
    {
        return m_callbacks.EnumerateProviders(pBuffer, pcbBuffer);
    };

    if (!Negotiate(m_enumerationBuffer, OperationEnumerateProviders, query) ||
        !DecodeProviders(decoded))
    {
        ETWMETA_DEBUG_PRINTF("EtwMetadataDecoder: {}\n", EtwMetaFormatError(m_lastError));
        succeeded = false;
    }
    else
    {
        providers = std::move(decoded);
        succeeded = true;
    }

    return succeeded;
}

bool
EtwMetadataDecoder::GetProviderEvents(
    std::string_view providerGuid,
    std::vector<EtwEventSchema>& events) noexcept(false)
{
    bool succeeded;
    EtwGuid guid;

    if (EtwGuidFromString(providerGuid, &guid))
    {
        succeeded = GetProviderEvents(guid, events);
    }
    else
    {
        events.clear();
        StartOperation(OperationEnumerateEvents, std::string(providerGuid));
        succeeded = SetError(EtwMetaError_InvalidGuid, 0);
    }

    return succeeded;
}

bool
EtwMetadataDecoder::GetProviderEvents(
    EtwGuid const& providerGuid,
    std::vector<EtwEventSchema>& events) noexcept(false)
{
    bool succeeded;
    std::string const providerGuidText = EtwGuidToString(providerGuid);
    std::vector<EtwEventSchema> decoded;

    events.clear();
    StartOperation(OperationEnumerateEvents, providerGuidText);

    auto query = [this, &providerGuid](void* pBuffer, uint32_t* pcbBuffer) noexcept
    {
        return m_callbacks.EnumerateManifestProviderEvents(providerGuid, pBuffer, pcbBuffer);
    };

    if (!Negotiate(m_enumerationBuffer, OperationEnumerateEvents, query) ||
        !DecodeEvents(providerGuid, providerGuidText, decoded))
    {
        ETWMETA_DEBUG_PRINTF("EtwMetadataDecoder: {}\n", EtwMetaFormatError(m_lastError));
        succeeded = false;
    }
    else
    {
        events = std::move(decoded);
        succeeded = true;
    }

    return succeeded;
}

void
EtwMetadataDecoder::StartOperation(
    char const* operation,
    std::string const& providerGuid) noexcept(false)
{
    m_lastError.Error = EtwMetaError_Success;
    m_lastError.Status = EtwMetaStatus_Success;
    m_lastError.Operation = operation;
    m_lastError.ProviderGuid = providerGuid;
    m_lastError.HasEvent = false;
    m_lastError.EventId = 0;
    m_lastError.EventVersion = 0;
    m_lastError.Value = 0;
}

bool
EtwMetadataDecoder::SetError(
    EtwMetaError error,
    uint64_t value) noexcept
{
    assert(error != EtwMetaError_Success);
    m_lastError.Error = error;
    m_lastError.Value = value;
    return false;
}

bool
EtwMetadataDecoder::CheckResult(
    EtwMetaError error,
    uint64_t value) noexcept
{
    return error == EtwMetaError_Success || SetError(error, value);
}

template<class QueryFn>
bool
EtwMetadataDecoder::Negotiate(
    Buffer<uint8_t>& buffer,
    char const* operation,
    QueryFn&& query) noexcept
{
    m_lastError.Operation = operation;
    EtwMetaError const error = NegotiateBuffer(buffer, query, &m_lastError.Status);
    return CheckResult(error, buffer.size());
}

bool
EtwMetadataDecoder::DecodeProviders(
    std::vector<EtwProviderInfo>& providers) noexcept(false)
{
    bool succeeded;
    uint8_t const* const pData = m_enumerationBuffer.data();
    size_t const cbData = m_enumerationBuffer.size();

    RecordArrayReader<RawArrayHeader> headerReader;
    RecordArrayReader<RawProviderInfo> providerReader;
    RawArrayHeader header;
    RawProviderInfo rawProvider;

    // PROVIDER_ENUMERATION_INFO is read as an array of one header.
    if (!CheckResult(headerReader.Init(pData, cbData, 0, 1), 1) ||
        !headerReader.MoveNext(&header))
    {
        succeeded = false;
    }
    else if (!CheckResult(
        providerReader.Init(pData, cbData, headerReader.EndOffset(), header.Count),
        header.Count))
    {
        succeeded = false;
    }
    else
    {
        // Count has been validated against the buffer size.
        providers.reserve(providerReader.Count());

        succeeded = true;
        while (providerReader.MoveNext(&rawProvider))
        {
            EtwProviderInfo provider;
            provider.Guid = EtwGuidToString(rawProvider.ProviderGuid);
            m_lastError.ProviderGuid = provider.Guid;

            if (rawProvider.SchemaSource > static_cast<uint32_t>(EtwSchemaSource_Max))
            {
                succeeded = SetError(EtwMetaError_UnknownSchemaSource, rawProvider.SchemaSource);
                break;
            }

            provider.SchemaSource = static_cast<EtwSchemaSource>(rawProvider.SchemaSource);

            if (!CheckResult(
                ReadOffsetString(pData, cbData, rawProvider.ProviderNameOffset, provider.Name),
                rawProvider.ProviderNameOffset))
            {
                succeeded = false;
                break;
            }

            providers.push_back(std::move(provider));
        }

        if (succeeded)
        {
            m_lastError.ProviderGuid.clear();
        }
    }

    return succeeded;
}

bool
EtwMetadataDecoder::DecodeEvents(
    EtwGuid const& providerGuid,
    std::string const& providerGuidText,
    std::vector<EtwEventSchema>& events) noexcept(false)
{
    bool succeeded;
    uint8_t const* const pData = m_enumerationBuffer.data();
    size_t const cbData = m_enumerationBuffer.size();

    RecordArrayReader<RawArrayHeader> headerReader;
    RecordArrayReader<EtwEventDescriptor> descriptorReader;
    RawArrayHeader header;
    EtwEventDescriptor descriptor;

    // PROVIDER_EVENT_INFO is read as an array of one header.
    if (!CheckResult(headerReader.Init(pData, cbData, 0, 1), 1) ||
        !headerReader.MoveNext(&header))
    {
        succeeded = false;
    }
    else if (!CheckResult(
        descriptorReader.Init(pData, cbData, headerReader.EndOffset(), header.Count),
        header.Count))
    {
        succeeded = false;
    }
    else
    {
        events.reserve(descriptorReader.Count());

        // Each descriptor is copied out of m_enumerationBuffer, so decoding
        // an event (which fills m_eventInfoBuffer) does not disturb the array.
        succeeded = true;
        while (descriptorReader.MoveNext(&descriptor))
        {
            EtwEventSchema event;
            if (!DecodeEvent(providerGuid, providerGuidText, descriptor, event))
            {
                succeeded = false;
                break;
            }

            events.push_back(std::move(event));
        }
    }

    return succeeded;
}

bool
EtwMetadataDecoder::DecodeEvent(
    EtwGuid const& providerGuid,
    std::string const& providerGuidText,
    EtwEventDescriptor const& eventDescriptor,
    EtwEventSchema& event) noexcept(false)
{
    bool succeeded;
    RecordArrayReader<RawTraceEventInfo> infoReader;
    RawTraceEventInfo info;

    m_lastError.HasEvent = true;
    m_lastError.EventId = eventDescriptor.Id;
    m_lastError.EventVersion = eventDescriptor.Version;

    auto query = [this, &providerGuid, &eventDescriptor](void* pBuffer, uint32_t* pcbBuffer) noexcept
    {
        return m_callbacks.GetManifestEventInformation(providerGuid, eventDescriptor, pBuffer, pcbBuffer);
    };

    if (!Negotiate(m_eventInfoBuffer, OperationGetEventInformation, query))
    {
        succeeded = false;
    }
    else if (
        !CheckResult(infoReader.Init(m_eventInfoBuffer.data(), m_eventInfoBuffer.size(), 0, 1), 1) ||
        !infoReader.MoveNext(&info))
    {
        succeeded = false;
    }
    else
    {
        auto const& desc = info.EventDescriptor;
        event.ProviderGuid = providerGuidText;
        event.Id = desc.Id;
        event.Version = desc.Version;
        event.Channel = desc.Channel;
        event.Level = desc.Level;
        event.Opcode = desc.Opcode;
        event.Task = desc.Task;
        event.Keyword = desc.Keyword & EtwKeywordMask;

        m_lastError.EventId = desc.Id;
        m_lastError.EventVersion = desc.Version;

        // Use the event name if present, otherwise the task name.
        uint32_t const nameOffset = info.EventNameOffset != 0
            ? info.EventNameOffset
            : info.TaskNameOffset;
        succeeded = true;
        if (nameOffset != 0)
        {
            std::string name;
            if (CheckResult(
                ReadOffsetString(m_eventInfoBuffer.data(), m_eventInfoBuffer.size(), nameOffset, name),
                nameOffset))
            {
                TrimTrailingSpaces(name);
                event.Name = std::move(name);
            }
            else
            {
                succeeded = false;
            }
        }

        if (succeeded)
        {
            succeeded = DecodeFields(infoReader.EndOffset(), info.TopLevelPropertyCount, event.Fields);
        }
    }

    return succeeded;
}

bool
EtwMetadataDecoder::DecodeFields(
    size_t offset,
    uint32_t fieldCount,
    std::vector<EtwFieldSchema>& fields) noexcept(false)
{
    bool succeeded;
    uint8_t const* const pData = m_eventInfoBuffer.data();
    size_t const cbData = m_eventInfoBuffer.size();

    RecordArrayReader<RawEventPropertyInfo> propertyReader;
    RawEventPropertyInfo epi;

    if (!CheckResult(propertyReader.Init(pData, cbData, offset, fieldCount), fieldCount))
    {
        succeeded = false;
    }
    else
    {
        fields.reserve(propertyReader.Count());

        // Fields are appended in order. A length/count reference can only
        // name a field that is already in 'fields'.
        succeeded = true;
        while (propertyReader.MoveNext(&epi))
        {
            EtwFieldSchema field;

            if (!CheckResult(
                ReadOffsetString(pData, cbData, epi.NameOffset, field.Name),
                epi.NameOffset))
            {
                succeeded = false;
                break;
            }

            if (!CheckResult(
                ResolveFieldSize(epi.Flags, PropertyParamFixedLength, PropertyParamLength,
                    epi.Length, fields, field.Length),
                epi.Length))
            {
                succeeded = false;
                break;
            }

            if (!CheckResult(
                ResolveFieldSize(epi.Flags, PropertyParamFixedCount, PropertyParamCount,
                    epi.Count, fields, field.Count),
                epi.Count))
            {
                succeeded = false;
                break;
            }

            if (field.Length.IsPresent() && field.Count.IsPresent())
            {
                ContractFailure("field has both a length and a count", m_lastError);
            }

            field.Type = EtwTypeTag::FromCode(epi.InType);
            field.OutType = epi.OutType;
            field.IsStruct = (epi.Flags & PropertyStruct) != 0;
            fields.push_back(std::move(field));
        }
    }

    return succeeded;
}
