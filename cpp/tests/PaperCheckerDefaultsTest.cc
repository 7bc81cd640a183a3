/** \brief Test cases for PaperCheckerDefaults
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
#define BOOST_TEST_MODULE PaperCheckerDefaults
#define BOOST_TEST_DYN_LINK

#include <stdexcept>
#include <string>
#include <boost/test/unit_test.hpp>
#include "FileUtil.h"
#include "PaperCheckerDefaults.h"


BOOST_AUTO_TEST_CASE(BuiltInTables) {
    const auto stop_words(PaperCheckerDefaults::GetStopWords());
    BOOST_CHECK_EQUAL(stop_words.size(), 50u);
    BOOST_CHECK_EQUAL(stop_words.count("的"), 1u);
    BOOST_CHECK_EQUAL(stop_words.count("为什么"), 1u);

    const auto lexicon(PaperCheckerDefaults::GetAcademicLexicon());
    BOOST_REQUIRE_EQUAL(lexicon.size(), 17u);
    BOOST_CHECK_EQUAL(lexicon.front(), "机器学习");
    BOOST_CHECK_EQUAL(lexicon.back(), "交叉验证");

    const auto dictionary(PaperCheckerDefaults::GetSegmentationDictionary());
    BOOST_REQUIRE_EQUAL(dictionary.count("天气"), 1u);
    BOOST_CHECK_EQUAL(dictionary.at("天气"), 3180u);
    BOOST_CHECK(dictionary.at("星期") > dictionary.at("星期天"));
}


BOOST_AUTO_TEST_CASE(LoadSegmentationDictionary) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string path(temp_dir.getDirectoryPath() + "/dict.txt");
    BOOST_REQUIRE(FileUtil::WriteString(path, "# word frequency tag\n论文 120 n\n\n  查重  \n相似度 7\n"));

    const auto dictionary(PaperCheckerDefaults::LoadSegmentationDictionary(path));
    BOOST_REQUIRE_EQUAL(dictionary.size(), 3u);
    BOOST_CHECK_EQUAL(dictionary.at("论文"), 120u);
    BOOST_CHECK_EQUAL(dictionary.at("查重"), 1u);
    BOOST_CHECK_EQUAL(dictionary.at("相似度"), 7u);
}


BOOST_AUTO_TEST_CASE(LoadSegmentationDictionaryErrors) {
    const FileUtil::AutoTempDirectory temp_dir;
    BOOST_CHECK_THROW(PaperCheckerDefaults::LoadSegmentationDictionary(temp_dir.getDirectoryPath() + "/missing.txt"),
                      std::runtime_error);

    const std::string bad_frequency(temp_dir.getDirectoryPath() + "/bad_frequency.txt");
    BOOST_REQUIRE(FileUtil::WriteString(bad_frequency, "论文 many\n"));
    BOOST_CHECK_THROW(PaperCheckerDefaults::LoadSegmentationDictionary(bad_frequency), std::runtime_error);

    const std::string garbled(temp_dir.getDirectoryPath() + "/garbled.txt");
    BOOST_REQUIRE(FileUtil::WriteString(garbled, "论文 12 n extra\n"));
    BOOST_CHECK_THROW(PaperCheckerDefaults::LoadSegmentationDictionary(garbled), std::runtime_error);
}


BOOST_AUTO_TEST_CASE(LoadWordList) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string path(temp_dir.getDirectoryPath() + "/words.txt");
    BOOST_REQUIRE(FileUtil::WriteString(path, "#comment\n机器学习\n\n 深度学习 \n"));

    const auto words(PaperCheckerDefaults::LoadWordList(path));
    BOOST_REQUIRE_EQUAL(words.size(), 2u);
    BOOST_CHECK_EQUAL(words[0], "机器学习");
    BOOST_CHECK_EQUAL(words[1], "深度学习");
}
