// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_8813409765402119
#define STRING_TOOLS_H_8813409765402119

#include <charconv>
#include <cstdio>  //snprintf
#include <string>
#include <string_view>
#include <vector>
#include <type_traits>


//UTF-8 std::string helpers
namespace sshb
{
inline bool isWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f'; }
inline bool isDigit     (char c) { return '0' <= c && c <= '9'; } //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }

inline bool contains  (std::string_view str, std::string_view term)    { return str.find(term) != std::string_view::npos; }
inline bool startsWith(std::string_view str, std::string_view prefix)  { return str.starts_with(prefix); }
inline bool endsWith  (std::string_view str, std::string_view postfix) { return str.ends_with(postfix); }

bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix);

enum class IfNotFoundReturn
{
    all,
    none
};
std::string afterLast  (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string beforeLast (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string afterFirst (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class Function> void split(std::string_view str, char delimiter, Function onStringPart);
[[nodiscard]] std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

[[nodiscard]] std::string trimCpy(std::string_view str);

[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);
void                      replace   (std::string& str, std::string_view oldTerm, std::string_view newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num>            Num stringTo(std::string_view str);

std::string formatAsHexString(std::string_view blob); //bytes -> (human-readable) hex string

template <class Num> std::string printNumber(const char* format, const Num& number); //format a single number using std::snprintf()






//---------------------- implementation ----------------------
inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
        if (asciiToLower(lhs[i]) != asciiToLower(rhs[i]))
            return false;
    return true;
}


inline
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && equalAsciiNoCase(str.substr(0, prefix.size()), prefix);
}


inline
std::string afterLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return std::string(infr == IfNotFoundReturn::all ? str : std::string_view());
    return std::string(str.substr(pos + term.size()));
}


inline
std::string beforeLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return std::string(infr == IfNotFoundReturn::all ? str : std::string_view());
    return std::string(str.substr(0, pos));
}


inline
std::string afterFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return std::string(infr == IfNotFoundReturn::all ? str : std::string_view());
    return std::string(str.substr(pos + term.size()));
}


inline
std::string beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return std::string(infr == IfNotFoundReturn::all ? str : std::string_view());
    return std::string(str.substr(0, pos));
}


template <class Function> inline
void split(std::string_view str, char delimiter, Function onStringPart)
{
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        if (pos == std::string_view::npos)
            return onStringPart(str);

        onStringPart(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
}


inline
std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe)
{
    std::vector<std::string> output;
    split(str, delimiter, [&](std::string_view block)
    {
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);
    });
    return output;
}


inline
std::string trimCpy(std::string_view str)
{
    while (!str.empty() && isWhiteSpace(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && isWhiteSpace(str.back()))
        str.remove_suffix(1);
    return std::string(str);
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    if (oldTerm.empty())
        return;

    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[64] = {};
    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    if (ec != std::errc())
        return S();
    return S(buffer, ptr);
}


//returns 0 on conversion error: like std::atoi()
template <class Num> inline
Num stringTo(std::string_view str)
{
    static_assert(std::is_integral_v<Num>);
    const std::string tmp = trimCpy(str);
    const char* first = tmp.c_str();
    const char* last  = first + tmp.size();
    if (first != last && *first == '+') //std::from_chars() does not accept a leading plus sign
        ++first;

    Num number = 0;
    if (const auto [ptr, ec] = std::from_chars(first, last, number);
        ec != std::errc() || ptr != last)
        return 0;
    return number;
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char* const hexDigits = "0123456789abcdef";
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto b = static_cast<unsigned char>(c);
        output += hexDigits[b >> 4];
        output += hexDigits[b & 0xf];
    }
    return output;
}


template <class Num> inline
std::string printNumber(const char* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[128] = {};
    const int charsWritten = std::snprintf(buffer, sizeof(buffer), format, number);
    if (charsWritten < 0 || charsWritten >= static_cast<int>(sizeof(buffer)))
        return std::string();
    return std::string(buffer, charsWritten);
}
}

#endif //STRING_TOOLS_H_8813409765402119
