/** \brief Test cases for ResultWriter
 *  \author The paper_checker authors
 *
 *  \copyright 2026 The paper_checker authors.  All rights reserved.
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
#define BOOST_TEST_MODULE ResultWriter
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>
#include "FileUtil.h"
#include "ResultWriter.h"


namespace {


std::string ReadFile(const std::string &path) {
    std::string contents;
    BOOST_REQUIRE(FileUtil::ReadString(path, &contents));
    return contents;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(TwoDecimalsWithoutNewline) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string path(temp_dir.getDirectoryPath() + "/result.txt");

    ResultWriter::Write(path, 0.5);
    BOOST_CHECK_EQUAL(ReadFile(path), "0.50");

    ResultWriter::Write(path, 1.0);
    BOOST_CHECK_EQUAL(ReadFile(path), "1.00");

    ResultWriter::Write(path, 0.6828);
    BOOST_CHECK_EQUAL(ReadFile(path), "0.68");
}


BOOST_AUTO_TEST_CASE(ParentDirectoriesAreCreated) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string path(temp_dir.getDirectoryPath() + "/a/b/c/result.txt");

    ResultWriter::Write(path, 0.25);
    BOOST_CHECK(FileUtil::IsDirectory(temp_dir.getDirectoryPath() + "/a/b/c"));
    BOOST_CHECK_EQUAL(ReadFile(path), "0.25");
}


BOOST_AUTO_TEST_CASE(UnwritablePathThrows) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string blocker(temp_dir.getDirectoryPath() + "/blocker");
    BOOST_REQUIRE(FileUtil::WriteString(blocker, "not a directory"));

    BOOST_CHECK_THROW(ResultWriter::Write(blocker + "/result.txt", 0.5), std::runtime_error);
}


BOOST_AUTO_TEST_CASE(Fallback) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string path(temp_dir.getDirectoryPath() + "/out/result.txt");

    ResultWriter::WriteFallback(path);
    BOOST_CHECK_EQUAL(ReadFile(path), "0.00");

    const std::string blocker(temp_dir.getDirectoryPath() + "/blocker");
    BOOST_REQUIRE(FileUtil::WriteString(blocker, ""));
    BOOST_CHECK_NO_THROW(ResultWriter::WriteFallback(blocker + "/result.txt"));
}
