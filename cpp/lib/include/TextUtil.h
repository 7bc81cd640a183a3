/** \file    TextUtil.h
 *  \brief   Declarations of text related utility functions.
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
#pragma once


#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include <cstdint>
#include <iconv.h>


namespace TextUtil {


constexpr uint32_t REPLACEMENT_CHARACTER(0xFFFDu);


/** \brief Converter between many text encodings.
 */
class EncodingConverter {
    friend class IdentityConverter;
    const std::string from_encoding_;
    const std::string to_encoding_;
protected:
    const iconv_t iconv_handle_;
public:
    static const std::string CANONICAL_UTF8_NAME;
public:
    virtual ~EncodingConverter();

    /** \brief Converts "input" to "output".
     *  \return True if the conversion succeeded, otherwise false.
     *  \note When this function returns false "*output" contains the unmodified copy of "input"!  Invalid or
     *        incomplete input sequences are conversion failures.
     */
    virtual bool convert(const std::string &input, std::string * const output);

    /** \return Returns a nullptr if an error occurred and then sets *error_message to a non-empty string.
     *          O/w an EncodingConverter instance will be returned and *error_message will be cleared.
     */
    static std::unique_ptr<EncodingConverter> Factory(const std::string &from_encoding, const std::string &to_encoding,
                                                      std::string * const error_message);
private:
    explicit EncodingConverter(const std::string &from_encoding, const std::string to_encoding, const iconv_t iconv_handle)
        : from_encoding_(from_encoding), to_encoding_(to_encoding), iconv_handle_(iconv_handle) { }
};


class IdentityConverter: public EncodingConverter {
    friend std::unique_ptr<EncodingConverter> EncodingConverter::Factory(const std::string &from_encoding,
                                                                         const std::string &to_encoding,
                                                                         std::string * const error_message);
    IdentityConverter(const std::string &encoding): EncodingConverter(encoding, encoding, (iconv_t)-1) { }
public:
    virtual bool convert(const std::string &input, std::string * const output) final override { *output = input; return true; }
};


/** \brief Lowercases "charset" and removes dashes, underscores and spaces, e.g. "UTF-8" -> "utf8". */
std::string CanonizeCharset(std::string charset);


/** \brief Converts "text" from "encoding" to UTF-8.
 *  \return False if no converter for "encoding" is available or "text" is not valid in "encoding".
 */
bool ConvertToUTF8(const std::string &encoding, const std::string &text, std::string * const utf8_text);


bool IsValidUTF8(const std::string &utf8_candidate);


/** \brief Converts "utf8_string" to a sequence of UTF-32 code points.
 *  \return False if "utf8_string" contained invalid or truncated byte sequences.  Each offending byte is
 *          represented by REPLACEMENT_CHARACTER in "*utf32_chars" so that the output is usable either way.
 */
bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars);


/** \return The UTF-8 encoding of "code_point".
 *  \throws std::runtime_error if "code_point" is larger than 0x10FFFF.
 */
std::string UTF32ToUTF8(const uint32_t code_point);
std::string UTF32ToUTF8(const std::vector<uint32_t>::const_iterator &begin, const std::vector<uint32_t>::const_iterator &end);
inline std::string UTF32ToUTF8(const std::vector<uint32_t> &utf32_chars)
    { return UTF32ToUTF8(utf32_chars.cbegin(), utf32_chars.cend()); }


extern const std::unordered_set<uint32_t> UNICODE_WHITESPACE;


/** \return True if "utf32_char" is one of the code points listed here: https://en.wikipedia.org/wiki/Whitespace_character,
            else false. */
inline bool IsWhitespace(const uint32_t utf32_char) {
    return UNICODE_WHITESPACE.find(utf32_char) != UNICODE_WHITESPACE.end();
}


/** \return True if "ch" is not a UTF-8 continuation byte. */
inline bool IsStartOfUTF8CodePoint(const char ch) { return (static_cast<unsigned char>(ch) & 0b11000000u) != 0b10000000u; }


/** \return The number of code points in "utf8_string". */
size_t CodePointCount(const std::string &utf8_string);


/** \return True if "utf32_char" is in the CJK Unified Ideographs block (U+4E00 - U+9FFF). */
inline bool IsCJKUnifiedIdeograph(const uint32_t utf32_char) { return utf32_char >= 0x4E00u and utf32_char <= 0x9FFFu; }


/** \return True for ASCII digits and full-width digits. */
inline bool IsDecimalDigit(const uint32_t utf32_char) {
    return (utf32_char >= '0' and utf32_char <= '9') or (utf32_char >= 0xFF10u and utf32_char <= 0xFF19u);
}


/** \return True if "utf32_char" is a letter or digit in one of the scripts we know about: Latin (including
 *          Latin-1 and Latin Extended-A/B), Greek, Cyrillic, Hiragana, Katakana, Hangul syllables, CJK ideographs
 *          and the full-width Latin forms.
 */
bool IsAlphanumeric(const uint32_t utf32_char);


/** \brief Replaces runs of Unicode whitespace with a single ASCII space and removes leading and trailing
 *         whitespace.
 *  \note  Invalid UTF-8 bytes are replaced by REPLACEMENT_CHARACTER.
 */
std::string &CollapseAndTrimWhitespace(std::string * const utf8_string);
inline std::string CollapseAndTrimWhitespace(const std::string &utf8_string) {
    std::string temp_utf8_string(utf8_string);
    return CollapseAndTrimWhitespace(&temp_utf8_string);
}


} // namespace TextUtil
