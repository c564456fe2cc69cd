#ifndef SEGLOADER_FILEIO_HPP
#define SEGLOADER_FILEIO_HPP

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#else
#include <io.h>
#include <windows.h>
#endif


namespace segloader
{
    namespace fs = std::filesystem;

    // Thin RAII wrapper over a C stream. Errors are reported through `std::error_code`
    // out-parameters, never thrown.
    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;

    public:
#ifdef _WIN32
        constexpr static wchar_t append_binary[] = L"ab";
        constexpr static wchar_t append_update_binary[] = L"ab+";
        constexpr static wchar_t read_update_binary[] = L"rb+";
        constexpr static wchar_t write_update_binary[] = L"wb+";
        constexpr static wchar_t write_binary[] = L"wb";
        constexpr static wchar_t read_binary[] = L"rb";
#else
        constexpr static char append_binary[] = "ab";
        constexpr static char append_update_binary[] = "ab+";
        constexpr static char read_update_binary[] = "rb+";
        constexpr static char write_update_binary[] = "wb+";
        constexpr static char write_binary[] = "wb";
        constexpr static char read_binary[] = "rb";
#endif

        FileIO() = default;

#ifdef _WIN32
        inline explicit FileIO(const fs::path& file_path,
                               const wchar_t* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(GetLastError(), std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#else
        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#endif

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        FileIO(FileIO&& rhs) noexcept
            : m_fs(std::exchange(rhs.m_fs, nullptr))
            , m_path(std::move(rhs.m_path))
        {
        }

        FileIO& operator=(FileIO&& rhs) noexcept
        {
            std::swap(m_fs, rhs.m_fs);
            std::swap(m_path, rhs.m_path);
            return *this;
        }

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Could not close file {}: {}", m_path.string(), ec.message());
                }
            }
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline int fd() const noexcept
        {
#ifndef _WIN32
            return ::fileno(m_fs);
#else
            return ::_fileno(m_fs);
#endif
        }

        inline int seek(std::int64_t offset, int origin) const noexcept
        {
#ifdef _WIN32
            return ::_fseeki64(m_fs, offset, origin);
#else
            return ::fseeko(m_fs, static_cast<off_t>(offset), origin);
#endif
        }

        inline std::int64_t tell() const noexcept
        {
#ifdef _WIN32
            return ::_ftelli64(m_fs);
#else
            return static_cast<std::int64_t>(::ftello(m_fs));
#endif
        }

        inline std::size_t read(void* buffer,
                                std::size_t element_size,
                                std::size_t element_count) const noexcept
        {
            return ::fread(buffer, element_size, element_count, m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        // Writes all `size` bytes or reports why it could not.
        inline void write_all(const void* buffer, std::size_t size, std::error_code& ec) const
        {
            ec.clear();
            if (size == 0)
                return;
            if (write(buffer, 1, size) != size)
            {
                ec.assign(errno ? errno : EIO, std::generic_category());
            }
        }

        inline void truncate(std::int64_t length, std::error_code& ec) const noexcept
        {
            ec.clear();
            ::fflush(m_fs);
#ifdef _WIN32
            fs::resize_file(m_path, static_cast<std::uintmax_t>(length), ec);
#else
            if (::ftruncate(fd(), static_cast<off_t>(length)) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        inline void flush(std::error_code& ec) noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        // Flushes the C stream and asks the OS to persist the data.
        inline void sync(std::error_code& ec) noexcept
        {
            flush(ec);
            if (ec)
                return;
#ifdef _WIN32
            if (::_commit(fd()) != 0)
#else
            if (::fsync(fd()) != 0)
#endif
            {
                ec.assign(errno, std::generic_category());
            }
        }

        inline const fs::path& path() const noexcept
        {
            return m_path;
        }

        // Appends the full content of `other`, read from its start, at the end of this file.
        // Returns the number of bytes copied.
        inline std::uint64_t append_from(const FileIO& other, std::error_code& ec) const
        {
            constexpr std::size_t bufsize = 32768;
            std::vector<char> buf(bufsize);
            std::uint64_t copied = 0;
            std::size_t size;

            ec.clear();
            if (other.seek(0, SEEK_SET) != 0 || this->seek(0, SEEK_END) != 0)
            {
                ec.assign(errno ? errno : EIO, std::generic_category());
                return copied;
            }

            while ((size = other.read(buf.data(), 1, bufsize)) > 0)
            {
                write_all(buf.data(), size, ec);
                if (ec)
                    return copied;
                copied += size;
            }
            if (other.error())
            {
                ec.assign(EIO, std::generic_category());
            }
            return copied;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
            // the stream is unusable after fclose, even on failure
            m_fs = nullptr;
        }

        inline int error() const noexcept
        {
            return ::ferror(m_fs);
        }
    };
}

#endif
