/** \file    ResultWriter.cc
 *  \brief   Implementation of the ResultWriter functions.
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
#include "ResultWriter.h"
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace ResultWriter {


const std::string FALLBACK_VALUE("0.00");


namespace {


void WriteString(const std::string &path, const std::string &contents) {
    const std::string directory(FileUtil::GetDirname(path));
    if (not directory.empty() and not FileUtil::IsDirectory(directory)
        and not FileUtil::MakeDirectory(directory, /* recursive = */ true))
        throw std::runtime_error("in ResultWriter::WriteString: failed to create directory \"" + directory + "\"! ("
                                 + std::string(std::strerror(errno)) + ")");

    if (unlikely(not FileUtil::WriteString(path, contents)))
        throw std::runtime_error("in ResultWriter::WriteString: failed to write \"" + path + "\"! ("
                                 + std::string(std::strerror(errno)) + ")");
}


} // unnamed namespace


void Write(const std::string &path, const double value) {
    WriteString(path, StringUtil::ToFixedPointString(value, 2));
}


void WriteFallback(const std::string &path) {
    try {
        WriteString(path, FALLBACK_VALUE);
    } catch (const std::exception &x) {
        LOG_WARNING("could not write the fallback result: " + std::string(x.what()));
    }
}


} // namespace ResultWriter
