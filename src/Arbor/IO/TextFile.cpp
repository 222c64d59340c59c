#include <Arbor/IO/TextFile.hpp>

#include <cerrno>
#include <cstring>
#include <format>

#if defined(_WIN32)
#include <cstdio>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace Arbor::IO
{
    namespace
    {
        [[nodiscard]] std::unexpected<FileError> SystemFailure(const std::string& path, const char* what, int code)
        {
            return std::unexpected(FileError {path, code, std::format("{} '{}': {}", what, path, std::strerror(code))});
        }
    }// namespace

    std::expected<std::string, FileError> ReadTextFile(const std::string& path)
    {
        if (path.empty())
            return std::unexpected(FileError {path, 0, "empty path"});

#if defined(_WIN32)
        std::FILE* file = std::fopen(path.c_str(), "rb");
        if (!file)
            return SystemFailure(path, "cannot open", errno);
        std::string contents;
        char        buffer[16 * 1024];
        while (true)
        {
            const auto count = std::fread(buffer, 1, sizeof(buffer), file);
            contents.append(buffer, count);
            if (count < sizeof(buffer))
                break;
        }
        const bool failed = std::ferror(file) != 0;
        std::fclose(file);
        if (failed)
            return SystemFailure(path, "cannot read", errno);
        return contents;
#else
        const int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0)
            return SystemFailure(path, "cannot open", errno);

        std::string contents;
        struct stat info {};
        if (::fstat(fd, &info) == 0 && info.st_size > 0)
            contents.reserve(static_cast<UIntSize>(info.st_size));

        char buffer[16 * 1024];
        while (true)
        {
            const ssize_t count = ::read(fd, buffer, sizeof(buffer));
            if (count < 0)
            {
                if (errno == EINTR)
                    continue;
                const int code = errno;
                ::close(fd);
                return SystemFailure(path, "cannot read", code);
            }
            if (count == 0)
                break;
            contents.append(buffer, static_cast<UIntSize>(count));
        }
        ::close(fd);
        return contents;
#endif
    }
}// namespace Arbor::IO
