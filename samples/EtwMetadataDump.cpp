// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

/*
Sample for listing ETW provider metadata using EtwMetadataCache.

This sample demonstrates the following:

- How to list the registered providers.
- How to list the events and fields of manifest-based providers.
- How to report failures using EtwMetaFormatError.
*/

#include <EtwMetadata.h>
#include <fmt/core.h>
#include <exception>
#include <vector>

/*
Parses and stores the command line options.
*/
struct DumpSettings
{
    std::vector<char const*> providerGuids;
    bool allManifestProviders;
    bool showUsage;

    DumpSettings(
        int argc,
        char* argv[])
        : allManifestProviders()
        , showUsage()
    {
        for (int i = 1; i < argc; i += 1)
        {
            char const* szArg = argv[i];
            if (szArg[0] != '/' && szArg[0] != '-')
            {
                providerGuids.push_back(szArg);
            }
            else if (szArg[1] == '\0' || szArg[2] != '\0')
            {
                // Options should be /X
                fmt::print("ERROR: Incorrectly-formatted option: {}\n", szArg);
                showUsage = true;
            }
            else
            {
                switch (szArg[1])
                {
                case '?':
                case 'h':
                case 'H':
                    showUsage = true;
                    break;

                case 'A':
                case 'a':
                    allManifestProviders = true;
                    break;

                default:
                    fmt::print("ERROR: Unrecognized option: {}\n", szArg);
                    showUsage = true;
                    break;
                }
            }
        }
    }
};

static void
PrintFieldSize(
    char const* szLabel,
    EtwFieldSize const& size)
{
    switch (size.Kind)
    {
    case EtwFieldSizeKind_Literal:
        fmt::print(" {}={}", szLabel, size.Value);
        break;
    case EtwFieldSizeKind_Reference:
        fmt::print(" {}=[{}]{}", szLabel, size.Value, size.FieldName);
        break;
    default:
        break;
    }
}

static void
PrintEvents(std::vector<EtwEventSchema> const& events)
{
    for (auto const& event : events)
    {
        fmt::print("  Event {}v{} {} (level {}, opcode {}, task {}, keyword 0x{:x})\n",
            event.Id,
            event.Version,
            event.Name ? *event.Name : "<unnamed>",
            event.Level,
            event.Opcode,
            event.Task,
            event.Keyword);

        for (auto const& field : event.Fields)
        {
            if (field.IsStruct)
            {
                fmt::print("    {}: struct", field.Name);
            }
            else if (field.Type.IsKnown())
            {
                fmt::print("    {}: {}", field.Name, EtwInTypeName(field.Type.KnownType()));
            }
            else
            {
                fmt::print("    {}: intype {}", field.Name, field.Type.Code);
            }

            PrintFieldSize("length", field.Length);
            PrintFieldSize("count", field.Count);
            fmt::print("\n");
        }
    }
}

/*
Prints the events of one provider. Returns false if the lookup failed.
*/
static bool
DumpProviderEvents(
    EtwMetadataCache& cache,
    char const* szProviderGuid)
{
    bool ok;

    auto result = cache.GetProviderEvents(szProviderGuid);
    if (result)
    {
        fmt::print("Provider {}: {} events\n", szProviderGuid, result.Value->size());
        PrintEvents(*result.Value);
        ok = true;
    }
    else
    {
        fmt::print("ERROR: {}\n", EtwMetaFormatError(*result.Error));
        ok = false;
    }

    return ok;
}

int main(int argc, char* argv[])
{
    int exitCode = 0;

    try
    {
        DumpSettings settings(argc, argv);
        if (settings.showUsage)
        {
            fmt::print(R"(
Usage:

  EtwMetadataDump [options] (providerGuid1 providerGuid2...)

With no provider GUIDs, lists the registered providers.
With provider GUIDs, lists the events and fields of each provider.

Options:

  -a  List the events and fields of every manifest-based provider.
)");
            return 1;
        }

        // Default-constructed cache uses the TDH callbacks.
        EtwMetadataCache cache;

        if (settings.providerGuids.empty())
        {
            auto providers = cache.GetProviders();
            if (!providers)
            {
                fmt::print("ERROR: {}\n", EtwMetaFormatError(*providers.Error));
                return 1;
            }

            for (auto const& provider : *providers.Value)
            {
                fmt::print("{} {} {}\n",
                    provider.Guid,
                    EtwSchemaSourceName(provider.SchemaSource),
                    provider.Name);

                if (settings.allManifestProviders &&
                    provider.SchemaSource == EtwSchemaSource_XmlFile &&
                    !DumpProviderEvents(cache, provider.Guid.c_str()))
                {
                    exitCode = 1;
                }
            }
        }
        else
        {
            for (auto szProviderGuid : settings.providerGuids)
            {
                if (!DumpProviderEvents(cache, szProviderGuid))
                {
                    exitCode = 1;
                }
            }
        }
    }
    catch (std::exception const& ex)
    {
        fmt::print("\nERROR: {}\n", ex.what());
        exitCode = 1;
    }

    return exitCode;
}
