#include "debpack/gzip.hpp"

#include <cstring>
#include <zlib.h>

namespace debpack {

namespace {

constexpr int kGzipWindowBits = 15 + 16;  // zlib writes the gzip framing
constexpr int kMemLevel = 9;
constexpr size_t kChunkSize = 16384;

} // namespace

std::vector<uint8_t> gzip_compress(const std::string& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    // No name, no comment, mtime 0: the member depends only on the input bytes
    gz_header header;
    std::memset(&header, 0, sizeof(header));
    header.os = 3;  // Unix
    if (deflateSetHeader(&strm, &header) != Z_OK) {
        deflateEnd(&strm);
        return {};
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    uint8_t chunk[kChunkSize];
    int ret = Z_OK;
    while (ret == Z_OK) {
        strm.next_out = chunk;
        strm.avail_out = sizeof(chunk);
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            break;
        }
        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - strm.avail_out));
    }
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return {};
    }
    return out;
}

} // namespace debpack
