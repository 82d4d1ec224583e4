#include "textnorm/io/file_system.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace textnorm {

namespace fs = std::filesystem;

namespace {

// Owns the descriptor of the temporary file and removes the file unless released
class TempFile {
public:
    explicit TempFile(std::string path_template) : path_(std::move(path_template)) {
        fd_ = ::mkstemp(path_.data());
        if (fd_ < 0) {
            error_ = std::error_code(errno, std::generic_category());
        }
    }
    ~TempFile() {
        close();
        if (!released_ && !error_) {
            ::unlink(path_.c_str());
        }
    }
    TempFile(const TempFile&) = delete;
    auto operator=(const TempFile&) -> TempFile& = delete;

    auto error() const -> std::error_code { return error_; }
    auto path() const -> const std::string& { return path_; }

    auto write_all(std::string_view bytes) -> std::error_code {
        while (!bytes.empty()) {
            auto written = ::write(fd_, bytes.data(), bytes.size());
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::error_code(errno, std::generic_category());
            }
            bytes.remove_prefix(static_cast<size_t>(written));
        }
        return {};
    }

    auto set_mode(fs::perms permissions) -> std::error_code {
        if (::fchmod(fd_, static_cast<mode_t>(permissions)) != 0) {
            return std::error_code(errno, std::generic_category());
        }
        return {};
    }

    auto close() -> std::error_code {
        if (fd_ < 0) {
            return {};
        }
        auto result = ::close(fd_);
        fd_ = -1;
        if (result != 0) {
            return std::error_code(errno, std::generic_category());
        }
        return {};
    }

    auto release() -> void { released_ = true; }

private:
    std::string path_;
    int fd_ = -1;
    std::error_code error_;
    bool released_ = false;
};

} // namespace

auto FileSystem::read_bytes(const fs::path& path) -> std::optional<std::string> {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }

    return content.str();
}

auto FileSystem::write_bytes_atomic(const fs::path& path, std::string_view bytes)
    -> std::error_code {
    std::error_code ec;

    // Keep the mode bits (executable scripts stay executable)
    auto original_permissions = fs::status(path, ec).permissions();
    if (ec) {
        return ec;
    }

    // Sibling file created exclusively under a fresh name, so rename stays on
    // one filesystem and no existing file is ever opened for writing
    TempFile temp(temp_template_for(path));
    if (temp.error()) {
        return temp.error();
    }

    if (auto write_ec = temp.write_all(bytes)) {
        return write_ec;
    }
    if (auto mode_ec = temp.set_mode(original_permissions & fs::perms::mask)) {
        return mode_ec;
    }
    if (auto close_ec = temp.close()) {
        return close_ec;
    }

    // Atomically replace original file
    fs::rename(temp.path(), path, ec);
    if (!ec) {
        temp.release();
    }
    return ec;
}

auto FileSystem::temp_template_for(const fs::path& path) -> std::string {
    return path.string() + ".textnorm.XXXXXX";
}

} // namespace textnorm
