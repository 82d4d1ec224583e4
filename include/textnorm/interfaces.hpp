#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace textnorm {

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_bytes(const std::filesystem::path& path) -> std::optional<std::string> = 0;
    // Either the whole content lands or the file is left untouched
    virtual auto write_bytes_atomic(const std::filesystem::path& path, std::string_view bytes)
        -> std::error_code = 0;
};

class IVersionControl {
public:
    virtual ~IVersionControl() = default;
    virtual auto find_root(const std::filesystem::path& start)
        -> std::optional<std::filesystem::path> = 0;
    // Paths are relative to root, in the order the index reports them
    virtual auto list_files(const std::filesystem::path& root, bool staged_only)
        -> std::optional<std::vector<std::filesystem::path>> = 0;
    virtual auto restage(const std::filesystem::path& root, const std::filesystem::path& relative_path)
        -> bool = 0;
};

} // namespace textnorm
