#pragma once

#include "textnorm/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace textnorm::decoder {

// Strict UTF-8 first (one leading BOM is dropped), then the legacy encoding
// if one is given. Malformed input never throws; it yields DecodeFailure.
auto decode(std::string_view raw, const std::optional<std::string>& legacy_encoding) -> DecodeResult;

auto decode_utf8(std::string_view raw) -> DecodeResult;
auto decode_legacy(std::string_view raw, const std::string& encoding) -> DecodeResult;

auto is_valid_utf8(std::string_view bytes) -> bool;
auto strip_bom(std::string_view bytes) -> std::string_view;

// True when ICU knows a converter by this name (e.g. "cp1251", "latin1")
auto is_encoding_supported(const std::string& encoding) -> bool;

} // namespace textnorm::decoder
