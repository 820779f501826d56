#pragma once

#include <cstdint>
#include <string_view>

namespace utils {

/**
 * @brief parse a size string like "8MiB", "512K", "1GB" or "64Mb".
 * units K M G T P E, "i" selects powers of 1024 instead of 1000,
 * a trailing "b" means bits, "B" or nothing means bytes.
 *
 * @throws std::invalid_argument if not a valid size string
 * @throws std::out_of_range if the value does not fit in 64 bits
 */
uint64_t parse_size(std::string_view size_str);

}  // namespace utils
