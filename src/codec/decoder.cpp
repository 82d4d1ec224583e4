#include "textnorm/codec/decoder.hpp"
#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <cstdint>
#include <limits>

namespace textnorm::decoder {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

auto fits_icu_length(std::string_view bytes) -> bool {
    return bytes.size() <= static_cast<size_t>(std::numeric_limits<int32_t>::max());
}

auto open_strict_converter(const std::string& encoding, UErrorCode& status)
    -> icu::LocalUConverterPointer {
    icu::LocalUConverterPointer converter(ucnv_open(encoding.c_str(), &status));
    if (U_FAILURE(status)) {
        return converter;
    }

    // Stop at the first unmappable or illegal byte instead of substituting U+FFFD
    ucnv_setToUCallBack(converter.getAlias(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr,
                        &status);
    return converter;
}

} // namespace

auto decode(std::string_view raw, const std::optional<std::string>& legacy_encoding)
    -> DecodeResult {
    auto canonical = decode_utf8(raw);
    if (std::holds_alternative<DecodedText>(canonical) || !legacy_encoding) {
        return canonical;
    }
    return decode_legacy(raw, *legacy_encoding);
}

auto decode_utf8(std::string_view raw) -> DecodeResult {
    auto body = strip_bom(raw);
    if (!is_valid_utf8(body)) {
        return DecodeFailure{.detail = "not valid UTF-8"};
    }
    return DecodedText{.utf8 = std::string(body), .encoding = SourceEncoding::CANONICAL};
}

auto decode_legacy(std::string_view raw, const std::string& encoding) -> DecodeResult {
    if (!fits_icu_length(raw)) {
        return DecodeFailure{.detail = "file too large to recode"};
    }
    if (encoding.empty()) {
        return DecodeFailure{.detail = "no legacy encoding given"};
    }

    UErrorCode status = U_ZERO_ERROR;
    auto converter = open_strict_converter(encoding, status);
    if (U_FAILURE(status)) {
        return DecodeFailure{.detail = "unknown encoding " + encoding};
    }

    icu::UnicodeString text(raw.data(), static_cast<int32_t>(raw.size()), converter.getAlias(),
                            status);
    if (U_FAILURE(status) || text.isBogus()) {
        return DecodeFailure{.detail = "not valid " + encoding + ": " + u_errorName(status)};
    }

    DecodedText decoded{.utf8 = {}, .encoding = SourceEncoding::RECODED};
    text.toUTF8String(decoded.utf8);
    return decoded;
}

auto is_valid_utf8(std::string_view bytes) -> bool {
    if (!fits_icu_length(bytes)) {
        return false;
    }

    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    const auto length = static_cast<int32_t>(bytes.size());

    int32_t offset = 0;
    while (offset < length) {
        UChar32 code_point = 0;
        U8_NEXT(data, offset, length, code_point);
        if (code_point < 0) {
            return false;
        }
    }
    return true;
}

auto strip_bom(std::string_view bytes) -> std::string_view {
    if (bytes.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        bytes.remove_prefix(kUtf8Bom.size());
    }
    return bytes;
}

auto is_encoding_supported(const std::string& encoding) -> bool {
    if (encoding.empty()) {
        return false;
    }
    UErrorCode status = U_ZERO_ERROR;
    auto converter = open_strict_converter(encoding, status);
    return U_SUCCESS(status);
}

} // namespace textnorm::decoder
