#pragma once

#include "textnorm/types.hpp"
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace textnorm::classifier {

// Only this many leading bytes are inspected for NUL bytes
inline constexpr size_t kSampleSize = 8192;

// Pure: looks at the name and the sample, never touches the disk
auto classify(const std::filesystem::path& path, std::string_view sample) -> ClassificationResult;

auto has_binary_extension(const std::filesystem::path& path) -> bool;
auto looks_binary(std::string_view sample) -> bool;
auto is_tab_sensitive(const std::filesystem::path& path) -> bool;

} // namespace textnorm::classifier
