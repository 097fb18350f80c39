#include "utf8.h"

namespace ncmunpack
{

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept
{
    std::size_t i = 0;
    while(i < size)
    {
        std::uint8_t c = data[i];
        std::size_t n = 0;
        std::uint32_t cp = 0;

        if(c < 0x80)
        {
            ++i;
            continue;
        }
        else if((c & 0xE0) == 0xC0)
        {
            n = 1;
            cp = c & 0x1F;
        }
        else if((c & 0xF0) == 0xE0)
        {
            n = 2;
            cp = c & 0x0F;
        }
        else if((c & 0xF8) == 0xF0)
        {
            n = 3;
            cp = c & 0x07;
        }
        else
            return false;

        if(size - i <= n)
            return false;

        for(std::size_t k = 1; k <= n; ++k)
        {
            if((data[i + k] & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (data[i + k] & 0x3F);
        }

        // overlong
        if((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000))
            return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += n + 1;
    }

    return true;
}

} // namespace ncmunpack
