/** \file    DocumentLoader.cc
 *  \brief   Implementation of the DocumentLoader functions.
 *  \author  The paper_checker authors
 */

/*
 *  Copyright 2026 The paper_checker authors
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
#include "DocumentLoader.h"
#include <stdexcept>
#include "FileUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace DocumentLoader {


const std::vector<std::string> CANDIDATE_ENCODINGS{ "UTF-8", "GBK", "GB2312", "UTF-16" };


std::string LoadStatusToString(const LoadStatus status) {
    switch (status) {
    case SUCCESS:
        return "success";
    case EMPTY_FILE:
        return "empty file";
    case NOT_FOUND:
        return "file not found or unreadable";
    case DECODE_ERROR:
        return "unsupported text encoding";
    case EMPTY_CONTENT:
        return "no content";
    }

    throw std::runtime_error("in DocumentLoader::LoadStatusToString: unknown status " + std::to_string(status) + "!");
}


namespace {


const std::string UTF8_BOM("\xEF\xBB\xBF");


bool Decode(const std::string &encoding, const std::string &raw_contents, std::string * const utf8_text) {
    if (TextUtil::CanonizeCharset(encoding) != TextUtil::EncodingConverter::CANONICAL_UTF8_NAME)
        return TextUtil::ConvertToUTF8(encoding, raw_contents, utf8_text);

    if (not TextUtil::IsValidUTF8(raw_contents))
        return false;
    if (raw_contents.compare(0, UTF8_BOM.length(), UTF8_BOM) == 0)
        *utf8_text = raw_contents.substr(UTF8_BOM.length());
    else
        *utf8_text = raw_contents;
    return true;
}


} // unnamed namespace


LoadResult Load(const std::string &path) {
    if (not FileUtil::IsRegularFile(path))
        return LoadResult(NOT_FOUND);

    std::string raw_contents;
    if (not FileUtil::ReadString(path, &raw_contents)) {
        LOG_WARNING("can't read \"" + path + "\"!");
        return LoadResult(NOT_FOUND);
    }

    if (raw_contents.empty())
        return LoadResult(EMPTY_FILE);

    for (const auto &encoding : CANDIDATE_ENCODINGS) {
        std::string utf8_text;
        if (not Decode(encoding, raw_contents, &utf8_text))
            continue;

        // The first encoding that fits decides, even if it only yields whitespace.
        if (TextUtil::CollapseAndTrimWhitespace(utf8_text).empty())
            return LoadResult(EMPTY_CONTENT, "", encoding);

        LOG_DEBUG("decoded \"" + path + "\" as " + encoding);
        return LoadResult(SUCCESS, utf8_text, encoding);
    }

    return LoadResult(DECODE_ERROR);
}


} // namespace DocumentLoader
