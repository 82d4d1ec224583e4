#pragma once

#include "textnorm/interfaces.hpp"
#include <filesystem>
#include <string>

namespace textnorm {

class FileSystem : public IFileSystem {
public:
    // Regular files only; symlinks and special files read as nullopt
    auto read_bytes(const std::filesystem::path& path) -> std::optional<std::string> override;
    auto write_bytes_atomic(const std::filesystem::path& path, std::string_view bytes)
        -> std::error_code override;

private:
    // mkstemp template next to path
    static auto temp_template_for(const std::filesystem::path& path) -> std::string;
};

} // namespace textnorm
