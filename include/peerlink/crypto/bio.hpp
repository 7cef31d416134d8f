#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <vector>
#include <openssl/bio.h>

#include <peerlink/crypto/pointers.hpp>
#include <peerlink/crypto/exception.hpp>

namespace peerlink::crypto
{

class BioTraits
{
    static constexpr size_t kBufferSize{4096};

public:
    static inline BioPtr openFile(const std::filesystem::path& path, const char* mode)
    {
        BioPtr result{BIO_new_file(path.c_str(), mode)};
        ThrowIfTrue(result == nullptr, "cannot open '" + path.string() + "'");
        return result;
    }

    /// @brief Creates a read-only BIO over @p data without copying it.
    ///
    /// The caller keeps @p data alive while the BIO is in use.
    static inline BioPtr createMemoryReader(const uint8_t* data, size_t size)
    {
        ThrowIfTrue(size > static_cast<size_t>(std::numeric_limits<int>::max()), "buffer too large");
        BioPtr bio{BIO_new_mem_buf(data, static_cast<int>(size))};
        ThrowIfTrue(bio == nullptr, "BIO_new_mem_buf");
        return bio;
    }

    static inline std::vector<uint8_t> readAllData(Bio* bio)
    {
        std::vector<uint8_t> data;
        std::array<uint8_t, kBufferSize> buffer{};
        size_t bytesRead{0};

        while (0 < BIO_read_ex(bio, buffer.data(), buffer.size(), &bytesRead))
        {
            data.insert(data.end(), buffer.data(), buffer.data() + bytesRead);
        }
        ThrowIfFalse(BIO_eof(bio), "BIO_read_ex");

        return data;
    }

    static inline std::vector<uint8_t> readFile(const std::filesystem::path& path)
    {
        auto bio = openFile(path, "rb");
        return readAllData(bio);
    }
};

} // namespace peerlink::crypto
