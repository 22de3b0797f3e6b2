// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

/*
Defines the EtwMetadataDecoder and EtwMetadataCache classes.
EtwMetadataDecoder decodes the provider, event and field metadata (the
schema) of registered ETW providers from the buffers returned by TDH.
*/

#pragma once
#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations of types from this header:
class EtwMetadataDecoder;           // Decodes provider and event metadata.
class EtwMetadataCache;             // Thread-safe memoization of decoder results.
class EtwMetadataCallbacks;         // Abstract base class for the metadata source.
struct EtwGuid;                     // Binary provider identity.
struct EtwEventDescriptor;          // Event identity as returned by the metadata source.
struct EtwProviderInfo;             // A registered provider: guid, name, schema source.
struct EtwEventSchema;              // One (id, version) event of a provider.
struct EtwFieldSchema;              // One top-level field of an event.
struct EtwFieldSize;                // Length or count of a field.
struct EtwTypeTag;                  // Known or raw in-type of a field.
struct EtwMetaErrorInfo;            // Details about a failed operation.
template<class T> struct EtwMetaResult; // Shared result of a cached operation.
enum EtwMetaError : uint8_t;        // Kind of failure.
enum EtwSchemaSource : uint8_t;     // Metadata format backing a provider.
enum EtwInType : uint16_t;          // Wire type of a field.
enum EtwTypeTagKind : uint8_t;      // Known or Raw.
enum EtwFieldSizeKind : uint8_t;    // None, Literal or Reference.
using EtwMetaStatus = uint32_t;     // Status returned by EtwMetadataCallbacks.

/*
Status values used by EtwMetadataCallbacks. The numeric values are the
Win32 error codes returned by the TDH functions.
*/
enum : EtwMetaStatus
{
    EtwMetaStatus_Success = 0,             // ERROR_SUCCESS
    EtwMetaStatus_NotSupported = 50,       // ERROR_NOT_SUPPORTED
    EtwMetaStatus_InsufficientBuffer = 122 // ERROR_INSUFFICIENT_BUFFER
};

/*
The event keyword bits that carry meaning. The top 16 bits of an event
descriptor's keyword are reserved.
*/
constexpr uint64_t EtwKeywordMask = 0x0000FFFFFFFFFFFF;

namespace EtwMetaInternal
{
    /*
    Simple growable array of POD items. Does not initialize new items.
    Used to hold the raw metadata buffers.
    */
    template<class T>
    class Buffer
    {
    public:
        using value_type = T;
        using size_type = unsigned;
        Buffer(Buffer const&) = delete;
        Buffer& operator=(Buffer const&) = delete;
        constexpr Buffer() noexcept;
        ~Buffer() noexcept;
        size_type size() const noexcept;
        size_type capacity() const noexcept;
        T const* data() const noexcept;
        T* data() noexcept;
        void clear() noexcept;
        void resize_unchecked(size_type newSize) noexcept; // precondition: newSize <= capacity
        bool reserve(size_type requiredCapacity, bool keepExistingData = true) noexcept;
        bool resize(size_type newSize, bool keepExistingData = true) noexcept;
    private:
        static size_type const MaxCapacity =
            size_type(~size_type(0) / sizeof(T)) - 1;
        bool Grow(size_type requiredCapacity, bool keepExistingData) noexcept; // precondition: capacity < requiredCapacity
        T* m_pData;
        size_type m_size;
        size_type m_capacity;
    };
}
// namespace EtwMetaInternal

/*
Kind of failure reported in EtwMetaErrorInfo::Error.
*/
enum EtwMetaError : uint8_t
{
    EtwMetaError_Success,
    EtwMetaError_SizeQueryFailed,         // Size query did not return InsufficientBuffer.
    EtwMetaError_FillFailed,              // Fill query did not return Success.
    EtwMetaError_ArrayOutOfBounds,        // Record array extends past the end of the buffer.
    EtwMetaError_StringOffsetOutOfBounds, // String offset is past the end of the buffer.
    EtwMetaError_FieldIndexOutOfBounds,   // Length/count refers to a field not yet decoded.
    EtwMetaError_UnknownSchemaSource,     // Schema source code outside EtwSchemaSource.
    EtwMetaError_InvalidGuid,             // Provider guid text could not be parsed.
    EtwMetaError_OutOfMemory,             // Unable to allocate the metadata buffer.
    EtwMetaError_Max
};

/*
The metadata format backing a provider's schema (TDH DECODING_SOURCE).
*/
enum EtwSchemaSource : uint8_t
{
    EtwSchemaSource_XmlFile,    // Manifest.
    EtwSchemaSource_Wbem,       // MOF class.
    EtwSchemaSource_Wpp,        // TMF.
    EtwSchemaSource_Tlg,        // TraceLogging.
    EtwSchemaSource_Unknown,    // DecodingSourceMax.
    EtwSchemaSource_Max = EtwSchemaSource_Unknown
};

/*
Field wire types (TDH_INTYPE). Codes above EtwInType_Max are valid but
undocumented; they are kept as raw values (see EtwTypeTag).
*/
enum EtwInType : uint16_t
{
    EtwInType_Null,
    EtwInType_UnicodeString,
    EtwInType_AnsiString,
    EtwInType_Int8,
    EtwInType_UInt8,
    EtwInType_Int16,
    EtwInType_UInt16,
    EtwInType_Int32,
    EtwInType_UInt32,
    EtwInType_Int64,
    EtwInType_UInt64,
    EtwInType_Float,
    EtwInType_Double,
    EtwInType_Boolean,
    EtwInType_Binary,
    EtwInType_Guid,
    EtwInType_Pointer,
    EtwInType_FileTime,
    EtwInType_SystemTime,
    EtwInType_Sid,
    EtwInType_HexInt32,
    EtwInType_HexInt64,
    EtwInType_ManifestCountedString,
    EtwInType_ManifestCountedAnsiString,
    EtwInType_Reserved24,
    EtwInType_ManifestCountedBinary,
    EtwInType_CountedString,
    EtwInType_CountedAnsiString,
    EtwInType_ReversedCountedString,
    EtwInType_ReversedCountedAnsiString,
    EtwInType_NonNullTerminatedString,
    EtwInType_NonNullTerminatedAnsiString,
    EtwInType_UnicodeChar,
    EtwInType_AnsiChar,
    EtwInType_SizeT,
    EtwInType_HexDump,
    EtwInType_WbemSid,
    EtwInType_Max = EtwInType_WbemSid
};

enum EtwTypeTagKind : uint8_t
{
    EtwTypeTagKind_Known,   // Code is a named EtwInType value.
    EtwTypeTagKind_Raw,     // Code is outside the named range.
};

enum EtwFieldSizeKind : uint8_t
{
    EtwFieldSizeKind_None,      // Not specified.
    EtwFieldSizeKind_Literal,   // Value is the literal length/count.
    EtwFieldSizeKind_Reference, // Value is the index of an earlier field.
};

/*
Binary GUID, laid out as in the Windows GUID structure.
*/
struct EtwGuid
{
    uint32_t Data1;
    uint16_t Data2;
    uint16_t Data3;
    uint8_t Data4[8];
};

bool operator==(EtwGuid const& a, EtwGuid const& b) noexcept;
bool operator!=(EtwGuid const& a, EtwGuid const& b) noexcept;

/*
Event identity, laid out as in the Windows EVENT_DESCRIPTOR structure.
*/
struct EtwEventDescriptor
{
    uint16_t Id;
    uint8_t Version;
    uint8_t Channel;
    uint8_t Level;
    uint8_t Opcode;
    uint16_t Task;
    uint64_t Keyword;
};

/*
The in-type of a field: either a named EtwInType (Known) or the raw code of
a type this library does not know about (Raw). Raw is not an error.
*/
struct EtwTypeTag
{
    EtwTypeTagKind Kind;
    uint16_t Code;

    static EtwTypeTag FromCode(uint16_t code) noexcept;

    bool IsKnown() const noexcept;

    // PRECONDITION: IsKnown().
    EtwInType KnownType() const noexcept;
};

bool operator==(EtwTypeTag const& a, EtwTypeTag const& b) noexcept;

/*
Length or count of a field.

- None: the field has no length/count information.
- Literal: Value is the length/count.
- Reference: Value is the index of an earlier field of the same event and
  FieldName is that field's name. The referenced field holds the
  length/count at runtime.
*/
struct EtwFieldSize
{
    EtwFieldSizeKind Kind = EtwFieldSizeKind_None;
    uint16_t Value = 0;
    std::string FieldName;

    bool IsPresent() const noexcept;
};

/*
One top-level field of an event. If IsStruct is true, the field is a
structure and Type/OutType hold the raw union words of the property record
(the index and count of the structure's members) instead of type codes.
*/
struct EtwFieldSchema
{
    std::string Name;
    EtwTypeTag Type;
    uint16_t OutType;
    bool IsStruct;
    EtwFieldSize Length; // Never present together with Count.
    EtwFieldSize Count;  // Never present together with Length.
};

/*
One event of a provider. Each (Id, Version) pair is a separate event.
*/
struct EtwEventSchema
{
    std::string ProviderGuid;
    uint16_t Id;
    uint8_t Version;
    uint8_t Channel;
    uint8_t Level;
    uint8_t Opcode;
    uint16_t Task;
    uint64_t Keyword;                // Masked with EtwKeywordMask.
    std::optional<std::string> Name; // Event name, else task name, trailing spaces trimmed.
    std::vector<EtwFieldSchema> Fields;
};

struct EtwProviderInfo
{
    std::string Guid;
    std::string Name;
    EtwSchemaSource SchemaSource;
};

/*
Details about the most recent failure. Operation is the name of the
metadata query in progress (e.g. "TdhEnumerateProviders"). Status is the
value returned by the query for SizeQueryFailed and FillFailed. Value is the
offending record count, offset, field index or schema source code.
*/
struct EtwMetaErrorInfo
{
    EtwMetaError Error = EtwMetaError_Success;
    EtwMetaStatus Status = EtwMetaStatus_Success;
    char const* Operation = "";
    std::string ProviderGuid;
    bool HasEvent = false;
    uint16_t EventId = 0;
    uint8_t EventVersion = 0;
    uint64_t Value = 0;
};

/*
Result of an EtwMetadataCache lookup. Exactly one of Value and Error is
non-null. All callers that look up the same key share the same objects.
*/
template<class T>
struct EtwMetaResult
{
    std::shared_ptr<T const> Value;
    std::shared_ptr<EtwMetaErrorInfo const> Error;

    explicit operator bool() const noexcept
    {
        return Value != nullptr;
    }
};

using EtwProvidersResult = EtwMetaResult<std::vector<EtwProviderInfo>>;
using EtwEventsResult = EtwMetaResult<std::vector<EtwEventSchema>>;

/*
Parses "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", optionally enclosed in
braces, hex digits in either case. Returns false if text is not a GUID.
*/
bool EtwGuidFromString(
    std::string_view text,
    EtwGuid* pGuid) noexcept;

/*
Returns the canonical text of a GUID: lowercase, enclosed in braces, e.g.
"{22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716}".
*/
std::string EtwGuidToString(
    EtwGuid const& guid) noexcept(false);

// Returns e.g. "ArrayOutOfBounds".
char const* EtwMetaErrorName(EtwMetaError error) noexcept;

// Returns e.g. "XmlFile".
char const* EtwSchemaSourceName(EtwSchemaSource schemaSource) noexcept;

// Returns e.g. "UNICODESTRING", or "" if inType is not a named value.
char const* EtwInTypeName(EtwInType inType) noexcept;

/*
Formats an error as a single line of text, e.g.
"TdhGetManifestEventInformation failed: FieldIndexOutOfBounds (value 3),
provider {...}, event 10v1".
*/
std::string EtwMetaFormatError(
    EtwMetaErrorInfo const& errorInfo) noexcept(false);

/*
EtwMetadataDecoder decodes provider and event metadata.

- EnumerateProviders returns every registered provider.
- GetProviderEvents returns every (id, version) event of a manifest-based
  provider with its top-level fields.

Each operation queries the metadata source through EtwMetadataCallbacks,
using the two-phase protocol (query size, then fill). The returned buffers
are treated as untrusted: every record array and string offset is
bounds-checked. On success, the results are independent of the raw buffers.

Methods return true on success. On failure they return false, leave the
output empty, and LastError() describes the failure. No partial results
are returned.

EtwMetadataDecoder is not thread-safe and does not cache. Use
EtwMetadataCache for memoized, thread-safe access.
*/
class EtwMetadataDecoder
{
public:

    EtwMetadataDecoder(EtwMetadataDecoder const&) = delete;
    EtwMetadataDecoder& operator=(EtwMetadataDecoder const&) = delete;
    ~EtwMetadataDecoder();

    /*
    Initializes a decoder that uses the default callbacks, i.e. calls the
    TDH functions directly. On platforms without TDH, every operation fails
    with SizeQueryFailed (status EtwMetaStatus_NotSupported).
    */
    EtwMetadataDecoder() noexcept;

    /*
    Initializes a decoder that uses the specified metadata source. The
    callbacks object must outlive the decoder.
    */
    explicit
    EtwMetadataDecoder(
        EtwMetadataCallbacks& callbacks) noexcept;

    /*
    Gets details about the most recent failure. Error is Success if the
    most recent operation succeeded.
    */
    EtwMetaErrorInfo const& LastError() const noexcept;

    /*
    Retrieves the list of registered providers in source order.

    Fails with SizeQueryFailed, FillFailed, OutOfMemory,
    ArrayOutOfBounds, StringOffsetOutOfBounds or UnknownSchemaSource.
    */
    bool EnumerateProviders(
        std::vector<EtwProviderInfo>& providers) noexcept(false);

    /*
    Retrieves the events of a manifest-based provider, one entry per
    (id, version), in source order. providerGuid is parsed as by
    EtwGuidFromString; the events report it in canonical form.

    Fails with InvalidGuid, SizeQueryFailed, FillFailed, OutOfMemory,
    ArrayOutOfBounds, StringOffsetOutOfBounds or FieldIndexOutOfBounds.
    LastError() names the event being decoded, if any.
    */
    bool GetProviderEvents(
        std::string_view providerGuid,
        std::vector<EtwEventSchema>& events) noexcept(false);

    bool GetProviderEvents(
        EtwGuid const& providerGuid,
        std::vector<EtwEventSchema>& events) noexcept(false);

private:

    void StartOperation(
        char const* operation,
        std::string const& providerGuid) noexcept(false);

    // Always returns false.
    bool SetError(
        EtwMetaError error,
        uint64_t value) noexcept;

    // Returns true if error is Success. Otherwise calls SetError.
    bool CheckResult(
        EtwMetaError error,
        uint64_t value) noexcept;

    template<class QueryFn>
    bool Negotiate(
        EtwMetaInternal::Buffer<uint8_t>& buffer,
        char const* operation,
        QueryFn&& query) noexcept;

    bool DecodeProviders(
        std::vector<EtwProviderInfo>& providers) noexcept(false);

    bool DecodeEvents(
        EtwGuid const& providerGuid,
        std::string const& providerGuidText,
        std::vector<EtwEventSchema>& events) noexcept(false);

    bool DecodeEvent(
        EtwGuid const& providerGuid,
        std::string const& providerGuidText,
        EtwEventDescriptor const& eventDescriptor,
        EtwEventSchema& event) noexcept(false);

    bool DecodeFields(
        size_t offset,
        uint32_t fieldCount,
        std::vector<EtwFieldSchema>& fields) noexcept(false);

private:

    EtwMetadataCallbacks& m_callbacks;
    EtwMetaErrorInfo m_lastError;
    EtwMetaInternal::Buffer<uint8_t> m_enumerationBuffer; // Providers or event descriptors.
    EtwMetaInternal::Buffer<uint8_t> m_eventInfoBuffer;   // Detail of the current event.
};

/*
EtwMetadataCache memoizes EtwMetadataDecoder results for the lifetime of the
cache object. Metadata is assumed not to change while the cache exists.

- GetProviders() runs EnumerateProviders at most once.
- GetProviderEvents(guid) runs GetProviderEvents at most once per provider.
  Different spellings of the same GUID share one entry.

Failures are cached as well: once a key has failed, later calls return the
same error without querying again.

All methods are thread-safe. If several threads request a key that has not
been computed yet, one of them computes it while the others wait, and all
of them receive the same shared result. The callbacks object must be safe
to call from any thread and must outlive the cache.
*/
class EtwMetadataCache
{
public:

    EtwMetadataCache(EtwMetadataCache const&) = delete;
    EtwMetadataCache& operator=(EtwMetadataCache const&) = delete;
    ~EtwMetadataCache();

    /*
    Initializes a cache that uses the default callbacks (TDH).
    */
    EtwMetadataCache() noexcept;

    explicit
    EtwMetadataCache(
        EtwMetadataCallbacks& callbacks) noexcept;

    EtwProvidersResult GetProviders() noexcept(false);

    /*
    Returns the events of the specified provider. A providerGuid that is not
    a valid GUID fails with InvalidGuid and is not cached.
    */
    EtwEventsResult GetProviderEvents(
        std::string_view providerGuid) noexcept(false);

    /*
    Returns the number of providers for which GetProviderEvents has an
    entry (computed, failed or in progress).
    */
    size_t ProviderEventsEntryCount() const noexcept;

private:

    template<class T>
    struct Entry
    {
        std::once_flag Once;
        EtwMetaResult<T> Result;
    };

    using ProvidersEntry = Entry<std::vector<EtwProviderInfo>>;
    using EventsEntry = Entry<std::vector<EtwEventSchema>>;

    EtwMetadataCallbacks& m_callbacks;
    mutable std::mutex m_eventsMutex; // Guards m_eventsByProvider (not the entries).
    ProvidersEntry m_providers;
    std::map<std::string, std::shared_ptr<EventsEntry>, std::less<>> m_eventsByProvider;
};

/*
EtwMetadataCallbacks is the metadata source used by EtwMetadataDecoder. If
the default behavior does not meet your needs (e.g. to dynamically load
TDH, or to serve metadata from somewhere else), derive from this class and
pass the object to the EtwMetadataDecoder or EtwMetadataCache constructor.

Each method must behave like the corresponding TDH function:

- If pBuffer is null or *pcbBuffer is too small, set *pcbBuffer to the
  required size and return EtwMetaStatus_InsufficientBuffer.
- Otherwise fill pBuffer, set *pcbBuffer to the size used, and return
  EtwMetaStatus_Success.
- Return any other status to report a failure.
*/
class EtwMetadataCallbacks // abstract
{
protected:

    // This class is abstract.
    constexpr EtwMetadataCallbacks() noexcept = default;

public:

    // Copy construction is not allowed on the abstract base class.
    EtwMetadataCallbacks(EtwMetadataCallbacks const&) = delete;

    // Copy assignment is not allowed on the abstract base class.
    EtwMetadataCallbacks& operator=(EtwMetadataCallbacks const&) = delete;

    /*
    Invoked by EtwMetadataDecoder::EnumerateProviders().
    The default implementation calls TdhEnumerateProviders.

    The buffer receives a PROVIDER_ENUMERATION_INFO header followed by
    TRACE_PROVIDER_INFO records and the provider name strings.
    */
    virtual EtwMetaStatus EnumerateProviders(
        void* pBuffer,
        uint32_t* pcbBuffer) noexcept;

    /*
    Invoked by EtwMetadataDecoder::GetProviderEvents().
    The default implementation calls TdhEnumerateManifestProviderEvents.

    The buffer receives a PROVIDER_EVENT_INFO header followed by
    EVENT_DESCRIPTOR records.
    */
    virtual EtwMetaStatus EnumerateManifestProviderEvents(
        EtwGuid const& providerGuid,
        void* pBuffer,
        uint32_t* pcbBuffer) noexcept;

    /*
    Invoked by EtwMetadataDecoder::GetProviderEvents() once per event.
    The default implementation calls TdhGetManifestEventInformation.

    The buffer receives a TRACE_EVENT_INFO header followed by
    EVENT_PROPERTY_INFO records and the name strings.
    */
    virtual EtwMetaStatus GetManifestEventInformation(
        EtwGuid const& providerGuid,
        EtwEventDescriptor const& eventDescriptor,
        void* pBuffer,
        uint32_t* pcbBuffer) noexcept;
};
