#include "textnorm/core/classifier.hpp"
#include <algorithm>
#include <iterator>
#include <string>

namespace textnorm::classifier {

namespace {

// Lower-case; compared against the lower-cased extension
constexpr std::string_view kBinaryExtensions[] = {
    ".png",  ".jpg",    ".jpeg",  ".gif",  ".bmp",   ".ico",   ".pdf",   ".zip",
    ".gz",   ".bz2",    ".xz",    ".7z",   ".rar",   ".jar",   ".war",   ".ear",
    ".class", ".exe",   ".dll",   ".pdb",  ".so",    ".dylib", ".a",     ".o",
    ".obj",  ".bin",    ".psd",   ".ai",   ".sketch", ".blend", ".fbx",  ".glb",
    ".gltf", ".otf",    ".ttf",   ".woff", ".woff2", ".eot",   ".wasm",  ".mp3",
    ".mp4",  ".mov",    ".avi",   ".mkv",  ".webm",  ".iso"};

// Exact, case-sensitive
constexpr std::string_view kTabSensitiveNames[] = {"Makefile", "makefile", "GNUmakefile"};

constexpr std::string_view kTabSensitiveExtensions[] = {".mk", ".mak"};

auto lowercase_extension(const std::filesystem::path& path) -> std::string {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
        return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
    });
    return extension;
}

template<size_t N>
auto contains(const std::string_view (&set)[N], std::string_view value) -> bool {
    return std::find(std::begin(set), std::end(set), value) != std::end(set);
}

} // namespace

auto classify(const std::filesystem::path& path, std::string_view sample) -> ClassificationResult {
    return ClassificationResult{
        .is_text = !has_binary_extension(path) && !looks_binary(sample.substr(0, kSampleSize)),
        .is_tab_sensitive = is_tab_sensitive(path)};
}

auto has_binary_extension(const std::filesystem::path& path) -> bool {
    auto extension = lowercase_extension(path);
    return !extension.empty() && contains(kBinaryExtensions, extension);
}

auto looks_binary(std::string_view sample) -> bool {
    return sample.find('\0') != std::string_view::npos;
}

auto is_tab_sensitive(const std::filesystem::path& path) -> bool {
    if (contains(kTabSensitiveNames, path.filename().string())) {
        return true;
    }
    return contains(kTabSensitiveExtensions, lowercase_extension(path));
}

} // namespace textnorm::classifier
