//
//  HashSplit.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <cstdio>
#include <fstream>
#include <iostream>

#include "HashSplit.hpp"

const std::string
SplitFilename(
    const size_t Index
)
{
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%02zu", Index + 1);
    return std::string(SPLIT_FILE_PREFIX) + buffer;
}

const std::optional<std::vector<std::filesystem::path>>
SplitFile(
    const std::filesystem::path& Input,
    const std::filesystem::path& OutputDirectory,
    const size_t LinesPerFile
)
{
    std::vector<std::filesystem::path> written;
    std::error_code ec;

    if (LinesPerFile == 0)
    {
        std::cerr << "Error: lines per file must be greater than zero" << std::endl;
        return std::nullopt;
    }

    std::ifstream infile(Input);
    if (!infile.is_open())
    {
        std::cerr << "Error: unable to open input file " << Input << std::endl;
        return std::nullopt;
    }

    std::filesystem::create_directories(OutputDirectory, ec);
    if (ec)
    {
        std::cerr << "Error: unable to create directory " << OutputDirectory << ": " << ec.message() << std::endl;
        return std::nullopt;
    }

    std::ofstream outfile;
    std::string line;
    size_t lines = 0;

    auto finish = [&]() -> bool {
        outfile.close();
        if (!outfile)
        {
            std::cerr << "Error: failed writing " << written.back() << std::endl;
            return false;
        }
        std::cerr << "[+] Wrote " << lines << " lines to " << written.back().string() << std::endl;
        return true;
    };

    while (std::getline(infile, line))
    {
        if (lines == LinesPerFile)
        {
            if (!finish())
            {
                return std::nullopt;
            }
            lines = 0;
        }

        if (!outfile.is_open())
        {
            written.push_back(OutputDirectory / SplitFilename(written.size()));
            outfile.open(written.back(), std::ios::out | std::ios::trunc);
            if (!outfile.is_open())
            {
                std::cerr << "Error: unable to open " << written.back() << " for writing" << std::endl;
                return std::nullopt;
            }
        }

        outfile << line << '\n';
        lines++;
    }

    if (outfile.is_open() && !finish())
    {
        return std::nullopt;
    }

    return written;
}
