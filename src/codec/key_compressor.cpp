#include "codec/key_compressor.hpp"

#include <zlib.h>

namespace vecture {

std::optional<std::string> KeyCompressor::compress(std::string_view data) {
    z_stream zs{};
    // windowBits=15 for the zlib wrapper
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED,
                     15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string compressed;
    compressed.resize(deflateBound(&zs, static_cast<uLong>(data.size())));

    zs.next_out = reinterpret_cast<Bytef*>(compressed.data());
    zs.avail_out = static_cast<uInt>(compressed.size());

    const int ret = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }

    compressed.resize(zs.total_out);
    return compressed;
}

std::optional<std::string> KeyCompressor::decompress(std::string_view data, size_t max_size) {
    z_stream zs{};
    if (inflateInit2(&zs, 15) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[16384];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return std::nullopt;
        }

        out.append(chunk, sizeof(chunk) - zs.avail_out);
        if (out.size() > max_size) {
            inflateEnd(&zs);
            return std::nullopt;
        }

        // Input exhausted without reaching the end of the stream
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            return std::nullopt;
        }
    }

    inflateEnd(&zs);
    return out;
}

} // namespace vecture
