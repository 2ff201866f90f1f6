#pragma once
/// @file UniqueFd.hpp
/// @brief RAII wrapper for POSIX file descriptors with owned/borrowed semantics

#include <unistd.h>

namespace CanLog {
namespace detail {

/// @brief RAII wrapper for POSIX file descriptors
///
/// An owned descriptor is closed on destruction or reset().
/// A borrowed descriptor belongs to the caller and is only forgotten, never closed.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    /// @brief Default constructor. Initializes with invalid fd(-1)
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of a file descriptor
    /// @param fd File descriptor to own
    explicit UniqueFd(int fd) noexcept : fd_(fd), owned_(true) {}

    /// @brief Wraps a descriptor owned by someone else
    /// @param fd File descriptor to use without closing
    static UniqueFd borrow(int fd) noexcept {
        UniqueFd h(fd);
        h.owned_ = false;
        return h;
    }

    /// @brief Destructor. Closes fd if valid and owned
    ~UniqueFd() { reset(); }

    // Copy prohibited
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    /// @brief Move constructor
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_), owned_(other.owned_) {
        other.fd_ = -1;
        other.owned_ = false;
    }

    /// @brief Move assignment operator
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            owned_ = other.owned_;
            other.fd_ = -1;
            other.owned_ = false;
        }
        return *this;
    }

    /// @brief Returns the file descriptor value
    /// @return Internal fd value (-1 if invalid)
    int get() const noexcept { return fd_; }

    /// @brief Checks if file descriptor is valid
    /// @return true if fd >= 0
    bool valid() const noexcept { return fd_ >= 0; }

    /// @brief Whether reset() will close the descriptor
    bool owned() const noexcept { return owned_ && fd_ >= 0; }

    /// @brief Bool conversion operator
    explicit operator bool() const noexcept { return valid(); }

    /// @brief Releases ownership (returns fd without closing)
    /// @return Previous fd value
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        owned_ = false;
        return tmp;
    }

    /// @brief Closes current fd (if owned) and takes ownership of a new one
    /// @param newFd New file descriptor (default: -1)
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0 && owned_)
            ::close(fd_);
        fd_ = newFd;
        owned_ = newFd >= 0;
    }

  private:
    int fd_ = -1;
    bool owned_ = false;
};

} // namespace detail
} // namespace CanLog
