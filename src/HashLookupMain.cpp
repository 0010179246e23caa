//
//  main.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "DispatchQueue.hpp"
#include "HashLookup.hpp"
#include "SigintHandler.hpp"
#include "Util.hpp"

// Define the help string as a global constant
const std::string HELP_STRING = R"(
Usage: hashlookup [options]

Input (exactly one):
  --file, -f <file>             Dump file to extract hashes from.
  --hash, -x <hash>             Look up a single hash.

Options:
  --type, -t <type>             Hash type: nt (ntlm), lm, md5, sha1, sha256.
  --out, --output, -o <file>    Append results to this file as well as the terminal.
  --extracted, -e <file>        Save the extracted hash list to this file.
  --url, -u <url>               Lookup service URL (default https://ntlm.pw/api/lookup).
  --chunk-size, -c <value>      Hashes per request, 1 to 300 (default 300).
  --delay, -d <seconds>         Pause between requests (default 5).
  --retries, -r <value>         Retries for a failed request, 0 to 10 (default 3).
  --timeout <seconds>           Per request timeout (default 30).
  --missing-as-failed           Report hashes omitted by the service as failed.
  --autohex, -a                 Write unprintable passwords as $HEX[..].
  --quiet, -q                   Disable the status line.
  --help                        Display this help message.

Tools:
  --password, -p <password>     With --file, check the hashes against one password locally.
  --split, -s <dir>             With --file, split the file into raw-hash-NN parts.
  --lines, -l <value>           Lines per part when splitting (default 500).
)";

#define ARGCHECK() \
    if (argc <= i + 1) \
    { \
        std::cerr << "No value specified for " << arg << std::endl; \
        return 1; \
    }

#define MINCHECK(value, minimum) \
    if ((value) < (minimum)) \
    { \
        std::cerr << "Error: " << arg << " must be at least " << (minimum) << std::endl; \
        return 1; \
    }

static void
RunAndStop(
    HashLookup* Lookup
)
{
    Lookup->Run();
    dispatch::CurrentDispatcher()->Stop();
}

int main(
    int argc,
    const char * argv[]
)
{
    if (argc < 2)
    {
        std::cout << HELP_STRING << std::endl;
        return 0;
    }

    HashLookup lookup;

    std::cerr << "HashLookup Bulk Hash Lookup" << std::endl;

    // Parse the command line arguments
    auto args = Util::ParseArgv(argv, argc);

    for (int i = 1; i < argc; i++)
    {
        std::string arg = args[i];

        if (arg == "--type" || arg == "-t")
        {
            ARGCHECK();
            auto typeStr = args[++i];
            auto type = ParseHashType(typeStr);
            if (type == HashTypeUndefined)
            {
                std::cerr << "Unrecognised hash type \"" << typeStr << "\"" << std::endl;
                return 1;
            }
            lookup.SetType(type);
        }
        else if (arg == "--file" || arg == "-f")
        {
            ARGCHECK();
            lookup.SetHashFile(args[++i]);
        }
        else if (arg == "--hash" || arg == "-x")
        {
            ARGCHECK();
            lookup.SetHash(args[++i]);
        }
        else if (arg == "--out" || arg == "--output" || arg == "-o")
        {
            ARGCHECK();
            lookup.SetOutFile(args[++i]);
        }
        else if (arg == "--extracted" || arg == "-e")
        {
            ARGCHECK();
            lookup.SetExtractedFile(args[++i]);
        }
        else if (arg == "--url" || arg == "-u")
        {
            ARGCHECK();
            lookup.SetUrl(args[++i]);
        }
        else if (arg == "--chunk-size" || arg == "-c")
        {
            ARGCHECK();
            int chunksize = atoi(args[++i].c_str());
            MINCHECK(chunksize, 1);
            lookup.SetChunkSize(chunksize);
        }
        else if (arg == "--delay" || arg == "-d")
        {
            ARGCHECK();
            double delay = atof(args[++i].c_str());
            MINCHECK(delay, 0);
            lookup.SetDelay(std::chrono::milliseconds(static_cast<long long>(delay * 1000)));
        }
        else if (arg == "--retries" || arg == "-r")
        {
            ARGCHECK();
            int retries = atoi(args[++i].c_str());
            MINCHECK(retries, 0);
            lookup.SetRetries(retries);
        }
        else if (arg == "--timeout")
        {
            ARGCHECK();
            int timeout = atoi(args[++i].c_str());
            MINCHECK(timeout, 1);
            lookup.SetTimeout(std::chrono::seconds(timeout));
        }
        else if (arg == "--missing-as-failed")
        {
            lookup.SetMissingAsFailed(true);
        }
        else if (arg == "--autohex" || arg == "-a")
        {
            lookup.SetHexlify(true);
        }
        else if (arg == "--quiet" || arg == "-q")
        {
            lookup.SetStatus(false);
        }
        else if (arg == "--password" || arg == "-p")
        {
            ARGCHECK();
            lookup.SetPassword(args[++i]);
        }
        else if (arg == "--split" || arg == "-s")
        {
            ARGCHECK();
            lookup.SetSplitDirectory(args[++i]);
        }
        else if (arg == "--lines" || arg == "-l")
        {
            ARGCHECK();
            int lines = atoi(args[++i].c_str());
            MINCHECK(lines, 1);
            lookup.SetSplitLines(lines);
        }
        else if (arg == "--help")
        {
            std::cout << HELP_STRING << std::endl;
            return 0;
        }
        else if (arg.starts_with("-"))
        {
            std::cerr << "Unknown option " << arg << std::endl;
            return 1;
        }
        else
        {
            std::cerr << "Unrecognised positional argument: " << arg << std::endl;
            return 1;
        }
    }

    SigintHandler sigint(lookup.GetInterruptFlag());

    //
    // Create the main dispatcher
    //
    auto mainDispatcher = dispatch::CreateAndEnterDispatcher(
        "main",
        std::bind(
            &RunAndStop,
            &lookup
        )
    );

    return lookup.Succeeded() ? 0 : 1;
}
