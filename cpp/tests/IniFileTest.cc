/** \brief Test cases for IniFile
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
#define BOOST_TEST_MODULE IniFile
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>
#include "FileUtil.h"
#include "IniFile.h"


namespace {


std::string WriteTestFile(const FileUtil::AutoTempDirectory &temp_dir, const std::string &filename,
                          const std::string &contents)
{
    const std::string path(temp_dir.getDirectoryPath() + "/" + filename);
    BOOST_REQUIRE(FileUtil::WriteString(path, contents));
    return path;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(SectionsAndEntries) {
    const FileUtil::AutoTempDirectory temp_dir;
    const IniFile ini_file(WriteTestFile(temp_dir, "test.conf",
                                         "# leading comment\n"
                                         "global = 1\n"
                                         "\n"
                                         "[Similarity]\n"
                                         "max_features = 250   ; trailing comment\n"
                                         "name = \"quoted # value\"\n"
                                         "long = first \\\n"
                                         "       second\n"
                                         "[ Dictionaries ]\n"
                                         "stop_words = stop.txt\n"
                                         "stop_words = other.txt\n"));

    const auto sections(ini_file.getSections());
    BOOST_REQUIRE_EQUAL(sections.size(), 3u);
    BOOST_CHECK_EQUAL(sections[0], "");
    BOOST_CHECK_EQUAL(sections[1], "Similarity");
    BOOST_CHECK_EQUAL(sections[2], "Dictionaries");

    BOOST_CHECK_EQUAL(ini_file.getUnsigned("", "global"), 1u);
    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Similarity", "max_features"), 250u);
    BOOST_CHECK_EQUAL(ini_file.getString("Similarity", "name"), "quoted # value");
    BOOST_CHECK_EQUAL(ini_file.getString("Similarity", "long"), "firstsecond");
    BOOST_CHECK_EQUAL(ini_file.getString("Dictionaries", "stop_words"), "other.txt");
    BOOST_CHECK_EQUAL(ini_file.getSection("Dictionaries")->size(), 1u);
}


BOOST_AUTO_TEST_CASE(Defaults) {
    const FileUtil::AutoTempDirectory temp_dir;
    const IniFile ini_file(WriteTestFile(temp_dir, "test.conf", "[Similarity]\nmax_features = 10\n"));

    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Similarity", "min_token_length", 2), 2u);
    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Other", "max_features", 7), 7u);
    BOOST_CHECK_EQUAL(ini_file.getString("Other", "path", "default"), "default");

    std::string value;
    BOOST_CHECK(ini_file.lookup("Similarity", "max_features", &value));
    BOOST_CHECK_EQUAL(value, "10");
    BOOST_CHECK(not ini_file.lookup("Similarity", "missing", &value));
    BOOST_CHECK(value.empty());
    BOOST_CHECK(ini_file.getSection("Other") == nullptr);
}


BOOST_AUTO_TEST_CASE(MissingValuesThrow) {
    const FileUtil::AutoTempDirectory temp_dir;
    const IniFile ini_file(WriteTestFile(temp_dir, "test.conf", "[Similarity]\nmax_features = many\n"));

    BOOST_CHECK_THROW(ini_file.getString("Similarity", "missing"), std::runtime_error);
    BOOST_CHECK_THROW(ini_file.getString("Other", "missing"), std::runtime_error);
    BOOST_CHECK_THROW(ini_file.getUnsigned("Similarity", "max_features"), std::runtime_error);
    BOOST_CHECK_THROW(ini_file.getUnsigned("Similarity", "max_features", 3), std::runtime_error);
}


BOOST_AUTO_TEST_CASE(Include) {
    const FileUtil::AutoTempDirectory temp_dir;
    WriteTestFile(temp_dir, "included.conf", "[Dictionaries]\nstop_words = stop.txt\n");
    const IniFile ini_file(WriteTestFile(temp_dir, "main.conf",
                                         "[Similarity]\nmax_features = 10\ninclude \"included.conf\"\n"));

    BOOST_CHECK_EQUAL(ini_file.getString("Dictionaries", "stop_words"), "stop.txt");
    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Similarity", "max_features"), 10u);
}


BOOST_AUTO_TEST_CASE(SyntaxErrors) {
    const FileUtil::AutoTempDirectory temp_dir;
    BOOST_CHECK_THROW(IniFile(temp_dir.getDirectoryPath() + "/missing.conf"), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "a.conf", "[Similarity\n")), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "b.conf", "[]\n")), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "c.conf", "[A]\n[A]\n")), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "d.conf", "[A]\nno equal sign\n")), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "e.conf", "[A]\n1name = x\n")), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "f.conf", "[A]\nname =\n")), std::runtime_error);
    BOOST_CHECK_THROW(IniFile(WriteTestFile(temp_dir, "g.conf", "[A]\nname = \"open\n")), std::runtime_error);
}
