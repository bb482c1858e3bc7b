#include <speedline/core/random_source.hpp>

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/random.h>
#include <unistd.h>

namespace speedline
{

void system_random_source::fill(std::span<std::uint8_t> out)
{
    std::size_t offset = 0;
    int last_error = 0;

    while (offset < out.size())
    {
        const ssize_t rc = ::getrandom(out.data() + offset, out.size() - offset, 0);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            last_error = errno;
            break;
        }
        if (rc == 0)
            break;
        offset += static_cast<std::size_t>(rc);
    }

    if (offset < out.size())
    {
        const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            throw std::system_error(errno, std::generic_category(), "open /dev/urandom");

        while (offset < out.size())
        {
            const ssize_t rc = ::read(fd, out.data() + offset, out.size() - offset);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                last_error = errno;
                break;
            }
            if (rc == 0)
                break;
            offset += static_cast<std::size_t>(rc);
        }
        ::close(fd);
    }

    if (offset < out.size())
        throw std::system_error(last_error != 0 ? last_error : EIO, std::generic_category(),
                                "random source exhausted");
}

} // namespace speedline
