#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

class StringUtils
{
public:
    static std::string trim(const std::string &text)
    {
        const char *whitespace = " \t\r\n\f\v";
        size_t start = text.find_first_not_of(whitespace);
        if (start == std::string::npos)
            return "";
        size_t end = text.find_last_not_of(whitespace);
        return text.substr(start, end - start + 1);
    }

    static std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    static std::vector<std::string> toLower(std::vector<std::string> values)
    {
        for (auto &value : values)
        {
            value = toLower(std::move(value));
        }
        return values;
    }

    /**
     * @brief Well-formed UTF-8: no stray continuation bytes, overlongs, surrogates or truncated sequences
     */
    static bool isValidUtf8(const std::string &text)
    {
        size_t i = 0;
        while (i < text.size())
        {
            unsigned char lead = static_cast<unsigned char>(text[i]);
            size_t length = 0;
            uint32_t code_point = 0;
            if (lead < 0x80)
            {
                ++i;
                continue;
            }
            else if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                code_point = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                code_point = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                code_point = lead & 0x07;
            }
            else
            {
                return false;
            }

            if (i + length > text.size())
                return false;
            for (size_t k = 1; k < length; ++k)
            {
                unsigned char next = static_cast<unsigned char>(text[i + k]);
                if ((next & 0xC0) != 0x80)
                    return false;
                code_point = (code_point << 6) | (next & 0x3F);
            }

            static const uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
            if (code_point < minimum[length] || code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF))
                return false;
            i += length;
        }
        return true;
    }

    static bool contains(const std::vector<std::string> &values, const std::string &value)
    {
        return std::find(values.begin(), values.end(), value) != values.end();
    }
};
