/** \brief Test cases for PaperChecker
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
#define BOOST_TEST_MODULE PaperChecker
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>
#include "FileUtil.h"
#include "PaperChecker.h"


namespace {


const std::string SUNDAY_TEXT("今天是星期天，天气晴，今天晚上我要去看电影。");


std::string WriteTestFile(const FileUtil::AutoTempDirectory &temp_dir, const std::string &filename,
                          const std::string &contents)
{
    const std::string path(temp_dir.getDirectoryPath() + "/" + filename);
    BOOST_REQUIRE(FileUtil::WriteString(path, contents));
    return path;
}


std::string ReadFile(const std::string &path) {
    std::string contents;
    BOOST_REQUIRE(FileUtil::ReadString(path, &contents));
    return contents;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(Paraphrase) {
    const PaperChecker paper_checker;
    const double score(paper_checker.calculateSimilarity(SUNDAY_TEXT, "今天是周天，天气晴朗，我晚上要去看电影。"));
    BOOST_CHECK_GT(score, 0.6);
    BOOST_CHECK_LT(score, 0.9);
}


BOOST_AUTO_TEST_CASE(UnrelatedText) {
    const PaperChecker paper_checker;
    BOOST_CHECK_LT(paper_checker.calculateSimilarity(SUNDAY_TEXT, "明天是星期一，天气雨，我打算在家休息。"), 0.3);
}


BOOST_AUTO_TEST_CASE(ParaphraseBeatsUnrelatedText) {
    const PaperChecker paper_checker;
    BOOST_CHECK_GT(paper_checker.calculateSimilarity(SUNDAY_TEXT, "今天是周天，天气晴朗，我晚上要去看电影。"),
                   paper_checker.calculateSimilarity(SUNDAY_TEXT, "明天是星期一，天气雨，我打算在家休息。"));
}


BOOST_AUTO_TEST_CASE(PunctuationAndSymbolsAreIgnored) {
    const PaperChecker paper_checker;
    BOOST_CHECK_GT(paper_checker.calculateSimilarity("Hello! 你好！@#$%^&*()", "Hello 你好"), 0.5);
}


BOOST_AUTO_TEST_CASE(Identity) {
    const PaperChecker paper_checker;
    BOOST_CHECK_CLOSE(paper_checker.calculateSimilarity(SUNDAY_TEXT, SUNDAY_TEXT), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(paper_checker.calculateSimilarity("中文内容测试", "中文内容测试"), 1.0, 1e-9);
}


BOOST_AUTO_TEST_CASE(OrdinaryTextIdentity) {
    const PaperChecker paper_checker;
    const std::string texts[] = {
        "气候变化影响农业产量", "人口老龄化带来养老压力", "区块链技术改变金融行业格局",
        "全球气候变暖导致极端天气事件频繁发生，各国政府正在加强合作应对挑战。",
    };
    for (const auto &text : texts) {
        BOOST_CHECK_GE(paper_checker.preprocess(text).size(), 4u);
        BOOST_CHECK_CLOSE(paper_checker.calculateSimilarity(text, text), 1.0, 1e-9);
    }
}


BOOST_AUTO_TEST_CASE(OrdinaryTextParaphrase) {
    const std::string original("全球气候变暖导致极端天气事件频繁发生，各国政府正在加强合作应对挑战。");
    const std::string paraphrase("由于全球变暖，极端天气事件越来越频繁，许多国家的政府开始加强合作来应对这一挑战。");
    const std::string unrelated("人口老龄化给社会保障体系带来巨大压力，养老金缺口不断扩大。");

    const PaperChecker paper_checker;
    const double paraphrase_score(paper_checker.calculateSimilarity(original, paraphrase));
    BOOST_CHECK_GT(paraphrase_score, 0.4);
    BOOST_CHECK_LT(paraphrase_score, 0.9);
    BOOST_CHECK_LT(paper_checker.calculateSimilarity(original, unrelated), 0.1);
}


BOOST_AUTO_TEST_CASE(EmptyTextsScoreZero) {
    const PaperChecker paper_checker;
    BOOST_CHECK_EQUAL(paper_checker.calculateSimilarity("正常文本内容", ""), 0.0);
    BOOST_CHECK_EQUAL(paper_checker.calculateSimilarity("", "正常文本内容"), 0.0);
    BOOST_CHECK_EQUAL(paper_checker.calculateSimilarity("", ""), 0.0);
    BOOST_CHECK_EQUAL(paper_checker.calculateSimilarity("，。！", "正常文本内容"), 0.0);
    BOOST_CHECK_EQUAL(paper_checker.calculateSimilarity("的 了 是", "正常文本内容"), 0.0);
}


BOOST_AUTO_TEST_CASE(SymmetryAndBounds) {
    const PaperChecker paper_checker;
    const std::string texts[] = {
        SUNDAY_TEXT, "今天是周天，天气晴朗，我晚上要去看电影。", "机器学习算法在数据分析中应用广泛。",
        "数据分析常用机器学习算法。", "Hello world",
    };
    for (const auto &text1 : texts) {
        for (const auto &text2 : texts) {
            const double score(paper_checker.calculateSimilarity(text1, text2));
            BOOST_CHECK_GE(score, 0.0);
            BOOST_CHECK_LE(score, 1.0);
            BOOST_CHECK_EQUAL(score, paper_checker.calculateSimilarity(text2, text1));
        }
    }
}


BOOST_AUTO_TEST_CASE(LongTexts) {
    std::string original, copy;
    for (unsigned i(0); i < 50; ++i)
        original += "机器学习是人工智能的重要分支。";
    for (unsigned i(0); i < 30; ++i)
        copy += "机器学习是人工智能的重要分支。";
    for (unsigned i(0); i < 20; ++i)
        copy += "深度学习是机器学习的一种方法。";

    const PaperChecker paper_checker;
    const double score(paper_checker.calculateSimilarity(original, copy));
    BOOST_CHECK_GT(score, 0.5);
    BOOST_CHECK_LT(score, 1.0);
}


BOOST_AUTO_TEST_CASE(LexiconTermsSurvivePreprocessing) {
    const PaperChecker paper_checker;
    const auto tokens(paper_checker.preprocess("机器学习算法在数据分析中应用广泛。"));
    BOOST_REQUIRE(not tokens.empty());
    BOOST_CHECK_EQUAL(tokens[0], "机器学习");
    BOOST_CHECK_EQUAL(tokens[1], "算法");
    BOOST_CHECK_EQUAL(tokens[2], "数据分析");
}


BOOST_AUTO_TEST_CASE(CheckPlagiarismWritesScore) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string original_path(WriteTestFile(temp_dir, "orig.txt", "原始论文内容。"));
    const std::string copy_path(WriteTestFile(temp_dir, "copy.txt", "抄袭版论文内容。"));
    const std::string output_path(temp_dir.getDirectoryPath() + "/results/nested/answer.txt");

    const PaperChecker paper_checker;
    const double score(paper_checker.checkPlagiarism(original_path, copy_path, output_path));
    BOOST_CHECK_GE(score, 0.0);
    BOOST_CHECK_LE(score, 1.0);

    const std::string output(ReadFile(output_path));
    BOOST_CHECK_EQUAL(output.length(), 4u);
    BOOST_CHECK_EQUAL(output[1], '.');
    BOOST_CHECK(output.find('\n') == std::string::npos);
}


BOOST_AUTO_TEST_CASE(IdenticalFilesScoreOne) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string original_path(WriteTestFile(temp_dir, "orig.txt", SUNDAY_TEXT));
    const std::string copy_path(WriteTestFile(temp_dir, "copy.txt", SUNDAY_TEXT));
    const std::string output_path(temp_dir.getDirectoryPath() + "/answer.txt");

    const PaperChecker paper_checker;
    BOOST_CHECK_CLOSE(paper_checker.checkPlagiarism(original_path, copy_path, output_path), 1.0, 1e-9);
    BOOST_CHECK_EQUAL(ReadFile(output_path), "1.00");
}


BOOST_AUTO_TEST_CASE(EncodingTransparency) {
    const FileUtil::AutoTempDirectory temp_dir;
    // "今天天气很好，我们一起去公园散步。" in GBK:
    const std::string gbk_path(WriteTestFile(temp_dir, "gbk.txt",
                                             "\xBD\xF1\xCC\xEC\xCC\xEC\xC6\xF8\xBA\xDC\xBA\xC3\xA3\xAC\xCE\xD2\xC3\xC7\xD2\xBB"
                                             "\xC6\xF0\xC8\xA5\xB9\xAB\xD4\xB0\xC9\xA2\xB2\xBD\xA1\xA3"));
    const std::string utf8_path(WriteTestFile(temp_dir, "utf8.txt", "今天天气很好，我们一起去公园散步。"));
    const std::string output_path(temp_dir.getDirectoryPath() + "/answer.txt");

    const PaperChecker paper_checker;
    BOOST_CHECK_CLOSE(paper_checker.checkPlagiarism(gbk_path, utf8_path, output_path), 1.0, 1e-9);
}


BOOST_AUTO_TEST_CASE(MissingInputWritesFallback) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string copy_path(WriteTestFile(temp_dir, "copy.txt", SUNDAY_TEXT));
    const std::string missing_path(temp_dir.getDirectoryPath() + "/nonexistent.txt");
    const std::string output_path(temp_dir.getDirectoryPath() + "/out/answer.txt");

    const PaperChecker paper_checker;
    try {
        paper_checker.checkPlagiarism(missing_path, copy_path, output_path);
        BOOST_FAIL("expected a CheckError");
    } catch (const PaperChecker::CheckError &check_error) {
        BOOST_CHECK_EQUAL(check_error.getKind(), PaperChecker::NOT_FOUND);
        BOOST_CHECK_EQUAL(check_error.getPath(), missing_path);
        BOOST_CHECK(check_error.isFileError());
    }
    BOOST_CHECK_EQUAL(ReadFile(output_path), "0.00");
}


BOOST_AUTO_TEST_CASE(EmptyInputWritesFallback) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string original_path(WriteTestFile(temp_dir, "orig.txt", SUNDAY_TEXT));
    const std::string empty_path(WriteTestFile(temp_dir, "empty.txt", ""));
    const std::string blank_path(WriteTestFile(temp_dir, "blank.txt", " \n "));
    const std::string output_path(temp_dir.getDirectoryPath() + "/answer.txt");

    const PaperChecker paper_checker;
    BOOST_REQUIRE(FileUtil::WriteString(output_path, "0.99"));
    BOOST_CHECK_THROW(paper_checker.checkPlagiarism(original_path, empty_path, output_path), PaperChecker::CheckError);
    BOOST_CHECK_EQUAL(ReadFile(output_path), "0.00");

    try {
        paper_checker.checkPlagiarism(blank_path, original_path, output_path);
        BOOST_FAIL("expected a CheckError");
    } catch (const PaperChecker::CheckError &check_error) {
        BOOST_CHECK_EQUAL(check_error.getKind(), PaperChecker::EMPTY_CONTENT);
    }
}


BOOST_AUTO_TEST_CASE(UndecodableInput) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string original_path(WriteTestFile(temp_dir, "orig.txt", SUNDAY_TEXT));
    const std::string garbage_path(WriteTestFile(temp_dir, "garbage.bin", "\xFF\xFF\xFF"));
    const std::string output_path(temp_dir.getDirectoryPath() + "/answer.txt");

    const PaperChecker paper_checker;
    try {
        paper_checker.checkPlagiarism(original_path, garbage_path, output_path);
        BOOST_FAIL("expected a CheckError");
    } catch (const PaperChecker::CheckError &check_error) {
        BOOST_CHECK_EQUAL(check_error.getKind(), PaperChecker::DECODE_ERROR);
    }
    BOOST_CHECK_EQUAL(ReadFile(output_path), "0.00");
}


BOOST_AUTO_TEST_CASE(UnwritableOutput) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string original_path(WriteTestFile(temp_dir, "orig.txt", SUNDAY_TEXT));
    const std::string blocker(WriteTestFile(temp_dir, "blocker", ""));

    const PaperChecker paper_checker;
    try {
        paper_checker.checkPlagiarism(original_path, original_path, blocker + "/answer.txt");
        BOOST_FAIL("expected a CheckError");
    } catch (const PaperChecker::CheckError &check_error) {
        BOOST_CHECK_EQUAL(check_error.getKind(), PaperChecker::WRITE_ERROR);
        BOOST_CHECK(not check_error.isFileError());
    }
}


namespace {


class FailingPaperChecker: public PaperChecker {
public:
    double calculateSimilarity(const std::string &/*text1*/, const std::string &/*text2*/) const override {
        throw std::runtime_error("out of luck");
    }
};


} // unnamed namespace


BOOST_AUTO_TEST_CASE(UnexpectedFailureWritesFallback) {
    const FileUtil::AutoTempDirectory temp_dir;
    const std::string original_path(WriteTestFile(temp_dir, "orig.txt", SUNDAY_TEXT));
    const std::string output_path(temp_dir.getDirectoryPath() + "/answer.txt");
    BOOST_REQUIRE(FileUtil::WriteString(output_path, "0.99"));

    FailingPaperChecker paper_checker;
    try {
        paper_checker.checkPlagiarism(original_path, original_path, output_path);
        BOOST_FAIL("expected a std::runtime_error");
    } catch (const PaperChecker::CheckError &) {
        BOOST_FAIL("unexpected failures must not turn into a CheckError");
    } catch (const std::runtime_error &x) {
        BOOST_CHECK_EQUAL(std::string(x.what()), "out of luck");
    }
    BOOST_CHECK_EQUAL(ReadFile(output_path), "0.00");
}


BOOST_AUTO_TEST_CASE(ConfigFromIniFile) {
    const FileUtil::AutoTempDirectory temp_dir;
    WriteTestFile(temp_dir, "stop_words.txt", "# only these\n天气\n电影\n");
    WriteTestFile(temp_dir, "lexicon.txt", "星期天\n");
    const std::string ini_path(WriteTestFile(temp_dir, "paper_checker.conf",
                                             "[Similarity]\n"
                                             "max_features = 100\n"
                                             "min_token_length = 1 ; keep single characters\n"
                                             "[Dictionaries]\n"
                                             "stop_words = stop_words.txt\n"
                                             "academic_lexicon = \"lexicon.txt\"\n"));

    const auto config(PaperChecker::Config::FromIniFile(ini_path));
    BOOST_CHECK_EQUAL(config.max_features_, 100u);
    BOOST_CHECK_EQUAL(config.min_token_length_, 1u);
    BOOST_CHECK_EQUAL(config.stop_words_.size(), 2u);
    BOOST_CHECK_EQUAL(config.stop_words_.count("天气"), 1u);
    BOOST_REQUIRE_EQUAL(config.academic_lexicon_.size(), 1u);
    BOOST_CHECK_EQUAL(config.academic_lexicon_[0], "星期天");
    BOOST_CHECK_EQUAL(config.segmentation_dictionary_.size(), PaperChecker::Config::Defaults().segmentation_dictionary_.size());

    const PaperChecker paper_checker(config);
    const auto tokens(paper_checker.preprocess("星期天天气"));
    BOOST_REQUIRE_EQUAL(tokens.size(), 1u);
    BOOST_CHECK_EQUAL(tokens[0], "星期天");
}


BOOST_AUTO_TEST_CASE(ConfigFromIniFileErrors) {
    const FileUtil::AutoTempDirectory temp_dir;
    BOOST_CHECK_THROW(PaperChecker::Config::FromIniFile(temp_dir.getDirectoryPath() + "/missing.conf"), std::runtime_error);

    const std::string zero_features(WriteTestFile(temp_dir, "zero.conf", "[Similarity]\nmax_features = 0\n"));
    BOOST_CHECK_THROW(PaperChecker::Config::FromIniFile(zero_features), std::runtime_error);

    const std::string bad_number(WriteTestFile(temp_dir, "bad.conf", "[Similarity]\nmin_token_length = two\n"));
    BOOST_CHECK_THROW(PaperChecker::Config::FromIniFile(bad_number), std::runtime_error);

    const std::string missing_dictionary(WriteTestFile(temp_dir, "dict.conf",
                                                       "[Dictionaries]\nsegmentation_dictionary = nowhere.txt\n"));
    BOOST_CHECK_THROW(PaperChecker::Config::FromIniFile(missing_dictionary), std::runtime_error);
}
