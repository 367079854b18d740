
#pragma once
#include <string>
#include <system_error>

namespace ecdigest {

enum class errc {
    input_too_large = 1,
    buffer_overflow,
    not_initialized,
    invalid_segment_size,
    invalid_shard_layout,
    empty_segment,
    source_read,
    open_failed,
    missing_segment
};

const std::error_category& ecdigest_category();

std::error_code make_error_code(errc e);

} // namespace ecdigest

namespace std {
template <> struct is_error_code_enum<ecdigest::errc> : true_type {};
} // namespace std
