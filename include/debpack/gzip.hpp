#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace debpack {

// Compress data into a reproducible gzip member: maximum compression, mtime 0,
// no embedded file name (equivalent to `gzip -9n`). Empty result on failure.
std::vector<uint8_t> gzip_compress(const std::string& data);

} // namespace debpack
