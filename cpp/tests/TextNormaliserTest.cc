/** \brief Test cases for TextNormaliser
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
#define BOOST_TEST_MODULE TextNormaliser
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>
#include "TextNormaliser.h"


BOOST_AUTO_TEST_CASE(CleanRemovesPunctuationAndSymbols) {
    const TextNormaliser normaliser;
    BOOST_CHECK_EQUAL(normaliser.clean("Hello! 你好！@#$%^&*()"), "Hello 你好");
    BOOST_CHECK_EQUAL(normaliser.clean("今天是星期天，天气晴。"), "今天是星期天天气晴");
    BOOST_CHECK_EQUAL(normaliser.clean("snake_case"), "snakecase");
}


BOOST_AUTO_TEST_CASE(CleanRemovesDigits) {
    const TextNormaliser normaliser;
    BOOST_CHECK_EQUAL(normaliser.clean("2021年3月"), "年月");
    BOOST_CHECK_EQUAL(normaliser.clean("第１２３名"), "第名");
    BOOST_CHECK_EQUAL(normaliser.clean("F1分数"), "F分数");
    BOOST_CHECK_EQUAL(normaliser.clean("12345"), "");
}


BOOST_AUTO_TEST_CASE(CleanCollapsesWhitespace) {
    const TextNormaliser normaliser;
    BOOST_CHECK_EQUAL(normaliser.clean("  机器  学习\t\n算法  "), "机器 学习 算法");
    BOOST_CHECK_EQUAL(normaliser.clean("a - b"), "a b");
    BOOST_CHECK_EQUAL(normaliser.clean(""), "");
    BOOST_CHECK_EQUAL(normaliser.clean(" \t\n"), "");
}


BOOST_AUTO_TEST_CASE(CleanDropsInvalidUTF8) {
    const TextNormaliser normaliser;
    BOOST_CHECK_EQUAL(normaliser.clean("ab\xFF" "cd"), "abcd");
}


BOOST_AUTO_TEST_CASE(CleanKeepsOtherScripts) {
    const TextNormaliser normaliser;
    BOOST_CHECK_EQUAL(normaliser.clean("Café Ωμέγα"), "Café Ωμέγα");
}


BOOST_AUTO_TEST_CASE(FilterDropsShortTokensAndStopWords) {
    const TextNormaliser normaliser;
    const std::vector<std::string> tokens{ "今天", "是", "我们", "天气", "", " ", "a", "机器学习", "的", "今天" };
    const std::vector<std::string> expected_tokens{ "今天", "天气", "机器学习", "今天" };
    const auto filtered_tokens(normaliser.filter(tokens));
    BOOST_CHECK_EQUAL_COLLECTIONS(filtered_tokens.cbegin(), filtered_tokens.cend(), expected_tokens.cbegin(),
                                  expected_tokens.cend());
}


BOOST_AUTO_TEST_CASE(FilterCountsCodePointsNotBytes) {
    const TextNormaliser normaliser(StopWordSet{}, 3);
    const std::vector<std::string> tokens{ "天气", "天气晴", "ab", "abc" };
    const std::vector<std::string> expected_tokens{ "天气晴", "abc" };
    const auto filtered_tokens(normaliser.filter(tokens));
    BOOST_CHECK_EQUAL_COLLECTIONS(filtered_tokens.cbegin(), filtered_tokens.cend(), expected_tokens.cbegin(),
                                  expected_tokens.cend());
}


BOOST_AUTO_TEST_CASE(FilterOfEmptySequence) {
    const TextNormaliser normaliser;
    BOOST_CHECK(normaliser.filter({}).empty());
}


BOOST_AUTO_TEST_CASE(DefaultStopWords) {
    const TextNormaliser normaliser;
    BOOST_CHECK_EQUAL(normaliser.getStopWords().size(), 50u);
    BOOST_CHECK_EQUAL(normaliser.getStopWords().count("为什么"), 1u);
    BOOST_CHECK_EQUAL(normaliser.getMinTokenLength(), 2u);
}
