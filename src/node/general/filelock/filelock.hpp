#pragma once
#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <string.h>
#include <string>
#include <sys/file.h>
#include <unistd.h>

// Exclusive advisory lock on an existing file, held for the lifetime of
// the object.
class Filelock {
public:
    Filelock(const std::string& path)
    {
#ifndef __APPLE__
        if (path == "" || path == ":memory:")
            return;
        fd = open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            throw std::runtime_error("Cannot open file \"" + path + "\": " + strerror(errno));
        }
        if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
            close(fd);
            fd = -1;
            throw std::runtime_error("Another instance is accessing the database \"" + path + "\": " + strerror(errno));
        }
#endif
    };
    Filelock(const Filelock&) = delete;
    ~Filelock()
    {
        if (fd >= 0) {
            close(fd);
        }
    };

private:
    int fd = -1;
};
