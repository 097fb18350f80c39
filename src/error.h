#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ncmunpack
{

enum class failure_t : std::uint8_t
{
    no_error = 0,
    invalid_file_type,
    invalid_key_length,
    invalid_info_length,
    invalid_image_length,
    decrypt_failed,
    info_decode_error,
    io_error
};

const char* to_string(failure_t f) noexcept;

class error : public std::runtime_error
{
    failure_t d_code;

public:
    explicit error(failure_t code) :
        std::runtime_error{to_string(code)},
        d_code{code}
    {}

    error(failure_t code, const std::string& what) :
        std::runtime_error{std::string{to_string(code)} + ": " + what},
        d_code{code}
    {}

    failure_t code() const noexcept { return d_code; }
};

} // namespace ncmunpack
