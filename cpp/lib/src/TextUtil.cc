/** \file    TextUtil.cc
 *  \brief   Implementation of text related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "TextUtil.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include "util.h"


namespace TextUtil {


const std::string EncodingConverter::CANONICAL_UTF8_NAME("utf8");


std::unique_ptr<EncodingConverter> EncodingConverter::Factory(const std::string &from_encoding, const std::string &to_encoding,
                                                              std::string * const error_message)
{
    if (CanonizeCharset(from_encoding) == CanonizeCharset(to_encoding)) {
        error_message->clear();
        return std::unique_ptr<EncodingConverter>(new IdentityConverter(to_encoding));
    }

    const iconv_t iconv_handle(::iconv_open(to_encoding.c_str(), from_encoding.c_str()));
    if (unlikely(iconv_handle == (iconv_t)-1)) {
        *error_message = "can't create an encoding converter for conversion from \"" + from_encoding + "\" to \"" + to_encoding
                         + "\"!";
        return std::unique_ptr<EncodingConverter>(nullptr);
    }

    error_message->clear();
    return std::unique_ptr<EncodingConverter>(new EncodingConverter(from_encoding, to_encoding, iconv_handle));
}


bool EncodingConverter::convert(const std::string &input, std::string * const output) {
    // Return the handle to its initial shift state, a previous call may have failed half-way through.
    ::iconv(iconv_handle_, nullptr, nullptr, nullptr, nullptr);

    std::vector<char> in_bytes(input.cbegin(), input.cend());
    static const size_t UTF8_SEQUENCE_MAXLEN(6);
    const size_t OUTBYTE_COUNT(UTF8_SEQUENCE_MAXLEN * input.length() + UTF8_SEQUENCE_MAXLEN);
    std::vector<char> out_bytes(OUTBYTE_COUNT);

    char *in_bytes_ptr(in_bytes.data()), *out_bytes_ptr(out_bytes.data());
    size_t inbytes_left(input.length()), outbytes_left(OUTBYTE_COUNT);
    errno = 0;
    const ssize_t converted_count(
        static_cast<ssize_t>(::iconv(iconv_handle_, &in_bytes_ptr, &inbytes_left, &out_bytes_ptr, &outbytes_left)));
    if (unlikely(converted_count == -1 or inbytes_left != 0)) {
        LOG_DEBUG("iconv(3) failed! (Trying to convert \"" + from_encoding_ + "\" to \"" + to_encoding_ + "\", errno = "
                  + std::to_string(errno) + ")");
        errno = 0;
        *output = input;
        return false;
    }

    output->assign(out_bytes.data(), OUTBYTE_COUNT - outbytes_left);
    return true;
}


EncodingConverter::~EncodingConverter() {
    if (iconv_handle_ != (iconv_t)-1 and unlikely(::iconv_close(iconv_handle_) == -1))
        LOG_ERROR("iconv_close(3) failed!");
}


std::string CanonizeCharset(std::string charset) {
    std::string canonized_charset;
    for (const char ch : charset) {
        if (ch != '-' and ch != '_' and ch != ' ')
            canonized_charset += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    return canonized_charset;
}


bool ConvertToUTF8(const std::string &encoding, const std::string &text, std::string * const utf8_text) {
    std::string error_message;
    const auto to_utf8_converter(EncodingConverter::Factory(encoding, "UTF-8", &error_message));
    if (to_utf8_converter == nullptr) {
        LOG_WARNING(error_message);
        return false;
    }

    return to_utf8_converter->convert(text, utf8_text);
}


namespace {


// Returns the number of continuation bytes that follow "lead_byte" or -1 if "lead_byte" can't start a sequence.
inline int GetContinuationByteCount(const unsigned char lead_byte) {
    if ((lead_byte & 0b10000000u) == 0b00000000u)
        return 0;
    if ((lead_byte & 0b11100000u) == 0b11000000u)
        return 1;
    if ((lead_byte & 0b11110000u) == 0b11100000u)
        return 2;
    if ((lead_byte & 0b11111000u) == 0b11110000u)
        return 3;
    return -1;
}


// Decodes the code point starting at "*ch".  On success "*ch" is advanced past the sequence, o/w by a single byte.
bool DecodeNextCodePoint(std::string::const_iterator * const ch, const std::string::const_iterator &end,
                         uint32_t * const code_point)
{
    const unsigned char lead_byte(static_cast<unsigned char>(**ch));
    const int continuation_byte_count(GetContinuationByteCount(lead_byte));
    if (unlikely(continuation_byte_count == -1)) {
        ++*ch;
        return false;
    }

    static const unsigned char LEAD_BYTE_MASKS[] = { 0b01111111u, 0b00011111u, 0b00001111u, 0b00000111u };
    uint32_t utf32_char(lead_byte & LEAD_BYTE_MASKS[continuation_byte_count]);
    auto next(*ch + 1);
    for (int i(0); i < continuation_byte_count; ++i, ++next) {
        if (unlikely(next == end or (static_cast<unsigned char>(*next) & 0b11000000u) != 0b10000000u)) {
            ++*ch;
            return false;
        }
        utf32_char = (utf32_char << 6u) | (static_cast<unsigned char>(*next) & 0b00111111u);
    }

    // Overlong encodings, UTF-16 surrogates and anything beyond the Unicode range are invalid.
    static const uint32_t MIN_CODE_POINTS[] = { 0x0u, 0x80u, 0x800u, 0x10000u };
    if (unlikely(utf32_char < MIN_CODE_POINTS[continuation_byte_count] or (utf32_char >= 0xD800u and utf32_char <= 0xDFFFu)
                 or utf32_char > 0x10FFFFu))
    {
        ++*ch;
        return false;
    }

    *ch = next;
    *code_point = utf32_char;
    return true;
}


} // unnamed namespace


bool IsValidUTF8(const std::string &utf8_candidate) {
    auto ch(utf8_candidate.cbegin());
    uint32_t code_point;
    while (ch != utf8_candidate.cend()) {
        if (not DecodeNextCodePoint(&ch, utf8_candidate.cend(), &code_point))
            return false;
    }

    return true;
}


bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars) {
    utf32_chars->clear();
    utf32_chars->reserve(utf8_string.size());

    bool valid(true);
    auto ch(utf8_string.cbegin());
    uint32_t code_point;
    while (ch != utf8_string.cend()) {
        if (likely(DecodeNextCodePoint(&ch, utf8_string.cend(), &code_point)))
            utf32_chars->emplace_back(code_point);
        else {
            utf32_chars->emplace_back(REPLACEMENT_CHARACTER);
            valid = false;
        }
    }

    return valid;
}


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFFu) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0x10FFFFu) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point " + std::to_string(code_point) + "!");

    return utf8;
}


std::string UTF32ToUTF8(const std::vector<uint32_t>::const_iterator &begin, const std::vector<uint32_t>::const_iterator &end) {
    std::string utf8;
    for (auto code_point(begin); code_point != end; ++code_point)
        utf8 += UTF32ToUTF8(*code_point);

    return utf8;
}


const std::unordered_set<uint32_t> UNICODE_WHITESPACE {
    0x0009, 0x000A, 0x000B, 0x000C, 0x000D, 0x0020, 0x0085, 0x00A0, 0x1680, 0x2000, 0x2001, 0x2002, 0x2003, 0x2004, 0x2005,
    0x2006, 0x2007, 0x2008, 0x2009, 0x200A, 0x2028, 0x2029, 0x202F, 0x205F, 0x3000, 0x180E, 0x200B, 0x200C, 0x200D, 0x2060,
    0xFEFF
};


size_t CodePointCount(const std::string &utf8_string) {
    return static_cast<size_t>(std::count_if(utf8_string.cbegin(), utf8_string.cend(), IsStartOfUTF8CodePoint));
}


namespace {


struct CodePointRange {
    uint32_t first_, last_;
};


// Must be sorted by "first_" and non-overlapping.
const CodePointRange ALPHANUMERIC_RANGES[] = {
    { 0x0030, 0x0039 }, // ASCII digits
    { 0x0041, 0x005A }, // ASCII upper case
    { 0x0061, 0x007A }, // ASCII lower case
    { 0x00AA, 0x00AA },
    { 0x00B5, 0x00B5 },
    { 0x00BA, 0x00BA },
    { 0x00C0, 0x00D6 }, // Latin-1
    { 0x00D8, 0x00F6 },
    { 0x00F8, 0x024F }, // Latin-1 and Latin Extended-A/B
    { 0x0386, 0x0386 }, // Greek
    { 0x0388, 0x03FF },
    { 0x0400, 0x0481 }, // Cyrillic
    { 0x048A, 0x052F },
    { 0x3041, 0x3096 }, // Hiragana
    { 0x30A1, 0x30FA }, // Katakana
    { 0x3400, 0x4DBF }, // CJK Unified Ideographs Extension A
    { 0x4E00, 0x9FFF }, // CJK Unified Ideographs
    { 0xAC00, 0xD7A3 }, // Hangul syllables
    { 0xFF10, 0xFF19 }, // full-width digits
    { 0xFF21, 0xFF3A }, // full-width upper case
    { 0xFF41, 0xFF5A }, // full-width lower case
};


} // unnamed namespace


bool IsAlphanumeric(const uint32_t utf32_char) {
    const auto range(std::upper_bound(std::begin(ALPHANUMERIC_RANGES), std::end(ALPHANUMERIC_RANGES), utf32_char,
                                      [](const uint32_t code_point, const CodePointRange &code_point_range)
                                      { return code_point < code_point_range.first_; }));
    if (range == std::begin(ALPHANUMERIC_RANGES))
        return false;

    return utf32_char <= (range - 1)->last_;
}


std::string &CollapseAndTrimWhitespace(std::string * const utf8_string) {
    std::vector<uint32_t> utf32_chars;
    UTF8ToUTF32(*utf8_string, &utf32_chars);

    std::string collapsed_string;
    bool last_char_was_whitespace(true);
    for (const uint32_t utf32_char : utf32_chars) {
        if (IsWhitespace(utf32_char)) {
            if (not last_char_was_whitespace) {
                last_char_was_whitespace = true;
                collapsed_string += ' ';
            }
        } else {
            last_char_was_whitespace = false;
            collapsed_string += UTF32ToUTF8(utf32_char);
        }
    }

    // String ends with a space? => Remove it!
    if (not collapsed_string.empty() and collapsed_string.back() == ' ')
        collapsed_string.resize(collapsed_string.size() - 1);

    utf8_string->swap(collapsed_string);
    return *utf8_string;
}


} // namespace TextUtil
