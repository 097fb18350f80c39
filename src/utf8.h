#pragma once

#include <cstddef>
#include <cstdint>

namespace ncmunpack
{

// Strict UTF-8 check: no overlongs, surrogates or code points past U+10FFFF.
bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept;

} // namespace ncmunpack
