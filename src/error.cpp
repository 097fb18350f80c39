#include "error.h"

namespace ncmunpack
{

const char* to_string(failure_t f) noexcept
{
    switch(f)
    {
    case failure_t::no_error:
        return "no error";
    case failure_t::invalid_file_type:
        return "invalid ncm format";
    case failure_t::invalid_key_length:
        return "invalid key length";
    case failure_t::invalid_info_length:
        return "invalid metadata length";
    case failure_t::invalid_image_length:
        return "invalid image length";
    case failure_t::decrypt_failed:
        return "decryption failed";
    case failure_t::info_decode_error:
        return "invalid metadata";
    case failure_t::io_error:
        return "i/o error";
    }

    return "unknown error";
}

} // namespace ncmunpack
