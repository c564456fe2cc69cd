#include <fstream>
#include <vector>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/utils.hpp>
#include <segloader/verifier.hpp>

namespace segloader
{
    std::string sha256(const std::string& str) noexcept
    {
        unsigned char hash[32];

        EVP_MD_CTX* mdctx;
        mdctx = EVP_MD_CTX_create();
        EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL);
        EVP_DigestUpdate(mdctx, str.c_str(), str.size());
        EVP_DigestFinal_ex(mdctx, hash, nullptr);
        EVP_MD_CTX_destroy(mdctx);

        return hex_string(hash, 32);
    }

    tl::expected<std::string, TransferError> sha256sum(const fs::path& path)
    {
        std::ifstream infile(path, std::ios::binary);
        if (!infile)
        {
            return tl::unexpected(TransferError{
                ErrorLevel::FATAL,
                ErrorCode::SL_IO,
                fmt::format("Could not open {} for verification", path.string()) });
        }

        unsigned char hash[32];
        EVP_MD_CTX* mdctx;
        mdctx = EVP_MD_CTX_create();
        EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL);

        constexpr std::size_t BUFSIZE = 32768;
        std::vector<char> buffer(BUFSIZE);

        while (infile)
        {
            infile.read(buffer.data(), BUFSIZE);
            size_t count = infile.gcount();
            if (!count)
                break;
            EVP_DigestUpdate(mdctx, buffer.data(), count);
        }
        const bool read_failed = infile.bad();

        EVP_DigestFinal_ex(mdctx, hash, nullptr);
        EVP_MD_CTX_destroy(mdctx);

        if (read_failed)
        {
            return tl::unexpected(
                TransferError{ ErrorLevel::FATAL,
                               ErrorCode::SL_IO,
                               fmt::format("Could not read {} for verification", path.string()) });
        }
        return hex_string(hash, 32);
    }

    tl::expected<bool, TransferError> verify(const fs::path& path, const std::string& expected)
    {
        auto digest = sha256sum(path);
        if (!digest)
        {
            return tl::unexpected(digest.error());
        }

        const bool matches = digest.value() == to_lower(expected);
        if (!matches)
        {
            spdlog::error("SHA-256 mismatch for {}: expected {}, got {}",
                          path.string(),
                          to_lower(expected),
                          digest.value());
        }
        return matches;
    }
}
