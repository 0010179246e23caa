//
//  Util.cpp
//  HashLookup
//
//  Created by Kryc on 11/08/2024.
//  Copyright © 2024 Kryc. All rights reserved.
//

#include <vector>
#include <string>
#include <cstdint>
#include <cstdio>
#include <ctype.h>
#include "Util.hpp"

namespace Util
{

std::string
ToHex(
    std::span<const uint8_t> Bytes
)
{
	return ToHex(Bytes.data(), Bytes.size());
}

std::string
ToHex(
	const uint8_t* Bytes,
	const size_t Length
)
{
	char buffer[3];
	std::string ret;

	buffer[2] = '\0';

	for (size_t i = 0; i < Length; i++)
	{
		snprintf(buffer, 3, "%02x", Bytes[i]);
		ret.push_back(buffer[0]);
		ret.push_back(buffer[1]);
	}

	return ret;
}

bool
IsHex(
	const std::string_view String
)
{
	if (String.empty())
	{
		return false;
	}

	for (char c : String)
	{
		if (!isxdigit(static_cast<unsigned char>(c)))
		{
			return false;
		}
	}

	return true;
}

std::string
ToLower(
    const std::string_view String
)
{
	std::string result;
	result.reserve(String.size());

	for (char c : String)
	{
		if (c >= 'A' && c <= 'Z')
		{
			result.push_back(c + ('a' - 'A'));
		}
		else
		{
			result.push_back(c);
		}
	}

	return result;
}

std::string_view
Trim(
    const std::string_view String
)
{
	const char* whitespace = " \t\r\n";
	const size_t first = String.find_first_not_of(whitespace);
	if (first == std::string_view::npos)
	{
		return {};
	}
	const size_t last = String.find_last_not_of(whitespace);
	return String.substr(first, last - first + 1);
}

const std::string
Hexlify(
    const std::string_view Value
)
{
    bool needshex = false;
    for (auto c : Value)
    {
        if (c < ' ' || c > '~' || c == ':')
        {
            needshex = true;
            break;
        }
    }
    if (!needshex)
    {
        return std::string(Value);
    }
    return "$HEX[" + Util::ToHex((const uint8_t*)Value.data(), Value.size()) + "]";
}

const std::vector<std::string>
ParseArgv(
    const char* Argv[],
    const int Argc
)
{
    std::vector<std::string> Args;
    Args.reserve(Argc);
    for (int i = 0; i < Argc; ++i) {
        Args.emplace_back(Argv[i]);
    }
    return Args;
}

}
