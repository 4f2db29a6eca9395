#include "utf8.hpp"

namespace mcptools::internal::utf8
{

namespace
{
// Length of the well-formed sequence starting at s[i], or 0.
size_t sequence_length(const std::string& s, size_t i)
{
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char lead = byte(i);
    size_t len = 0;
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        len = 2;
    else if (lead >= 0xE0 && lead <= 0xEF)
        len = 3;
    else if (lead >= 0xF0 && lead <= 0xF4)
        len = 4;
    else
        return 0;
    if (i + len > s.size())
        return 0;
    for (size_t k = 1; k < len; ++k)
        if ((byte(i + k) & 0xC0) != 0x80)
            return 0;
    // overlongs, surrogates and code points above U+10FFFF
    unsigned char second = byte(i + 1);
    if (lead == 0xE0 && second < 0xA0)
        return 0;
    if (lead == 0xED && second > 0x9F)
        return 0;
    if (lead == 0xF0 && second < 0x90)
        return 0;
    if (lead == 0xF4 && second > 0x8F)
        return 0;
    return len;
}
} // namespace

bool is_valid(const std::string& s)
{
    for (size_t i = 0; i < s.size();)
    {
        size_t len = sequence_length(s, i);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

std::vector<std::string> split_code_points(const std::string& s)
{
    std::vector<std::string> units;
    units.reserve(s.size());
    for (size_t i = 0; i < s.size();)
    {
        size_t len = sequence_length(s, i);
        if (len == 0)
            len = 1;
        units.push_back(s.substr(i, len));
        i += len;
    }
    return units;
}

size_t count_code_points(const std::string& s)
{
    size_t n = 0;
    for (size_t i = 0; i < s.size();)
    {
        size_t len = sequence_length(s, i);
        i += len == 0 ? 1 : len;
        ++n;
    }
    return n;
}

} // namespace mcptools::internal::utf8
