/** \file    PaperChecker.cc
 *  \brief   Implementation of class PaperChecker.
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
#include "PaperChecker.h"
#include "DocumentLoader.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "ResultWriter.h"
#include "SimilarityScorer.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "WallClockTimer.h"
#include "util.h"


PaperChecker::Config PaperChecker::Config::Defaults() {
    Config config;
    config.stop_words_              = PaperCheckerDefaults::GetStopWords();
    config.academic_lexicon_        = PaperCheckerDefaults::GetAcademicLexicon();
    config.segmentation_dictionary_ = PaperCheckerDefaults::GetSegmentationDictionary();
    config.max_features_            = PaperCheckerDefaults::MAX_FEATURES;
    config.min_token_length_        = PaperCheckerDefaults::MIN_TOKEN_LENGTH;

    return config;
}


PaperChecker::Config PaperChecker::Config::FromIniFile(const std::string &ini_file_path) {
    const IniFile ini_file(ini_file_path);
    Config config(Defaults());

    config.max_features_ = ini_file.getUnsigned("Similarity", "max_features", config.max_features_);
    if (unlikely(config.max_features_ == 0))
        throw std::runtime_error("in PaperChecker::Config::FromIniFile: max_features must be positive in \"" + ini_file_path
                                 + "\"!");
    config.min_token_length_ = ini_file.getUnsigned("Similarity", "min_token_length", config.min_token_length_);

    const std::string base_directory(FileUtil::GetDirname(ini_file_path));
    std::string path;
    if (ini_file.lookup("Dictionaries", "segmentation_dictionary", &path))
        config.segmentation_dictionary_ =
            PaperCheckerDefaults::LoadSegmentationDictionary(FileUtil::MakeAbsolutePath(base_directory, path));
    if (ini_file.lookup("Dictionaries", "academic_lexicon", &path))
        config.academic_lexicon_ = PaperCheckerDefaults::LoadWordList(FileUtil::MakeAbsolutePath(base_directory, path));
    if (ini_file.lookup("Dictionaries", "stop_words", &path)) {
        const auto stop_words(PaperCheckerDefaults::LoadWordList(FileUtil::MakeAbsolutePath(base_directory, path)));
        config.stop_words_ = StopWordSet(stop_words.cbegin(), stop_words.cend());
    }

    return config;
}


PaperChecker::PaperChecker(const Config &config)
    : normaliser_(config.stop_words_, config.min_token_length_),
      segmenter_(config.academic_lexicon_, config.segmentation_dictionary_), vectoriser_(config.max_features_)
{
}


std::vector<std::string> PaperChecker::preprocess(const std::string &text) const {
    const std::string cleaned_text(normaliser_.clean(text));
    if (cleaned_text.empty())
        return {};

    return normaliser_.filter(segmenter_.segment(cleaned_text));
}


double PaperChecker::calculateSimilarity(const std::string &text1, const std::string &text2) const {
    WallClockTimer timer(WallClockTimer::NON_CUMULATIVE_WITH_AUTO_START);
    const auto tokens1(preprocess(text1)), tokens2(preprocess(text2));
    const double similarity(SimilarityScorer::ScoreTokens(tokens1, tokens2, vectoriser_));
    timer.stop();

    LOG_INFO("similarity computed in " + StringUtil::ToFixedPointString(timer.getTime(), 3) + "s");
    return similarity;
}


std::string PaperChecker::loadDocument(const std::string &path) const {
    const DocumentLoader::LoadResult load_result(DocumentLoader::Load(path));
    if (load_result.ok())
        return load_result.text_;

    ErrorKind error_kind;
    switch (load_result.status_) {
    case DocumentLoader::NOT_FOUND:
        error_kind = NOT_FOUND;
        break;
    case DocumentLoader::DECODE_ERROR:
        error_kind = DECODE_ERROR;
        break;
    default: // EMPTY_FILE and EMPTY_CONTENT
        error_kind = EMPTY_CONTENT;
    }

    throw CheckError(error_kind, path, "\"" + path + "\": " + DocumentLoader::LoadStatusToString(load_result.status_));
}


double PaperChecker::checkPlagiarism(const std::string &original_path, const std::string &copy_path,
                                     const std::string &output_path) const
{
    try {
        LOG_INFO("reading documents...");
        const std::string original_text(loadDocument(original_path));
        const std::string copy_text(loadDocument(copy_path));
        LOG_INFO("original: " + std::to_string(TextUtil::CodePointCount(original_text)) + " characters, copy: "
                 + std::to_string(TextUtil::CodePointCount(copy_text)) + " characters");

        LOG_INFO("computing similarity...");
        const double similarity(calculateSimilarity(original_text, copy_text));

        try {
            ResultWriter::Write(output_path, similarity);
        } catch (const std::runtime_error &x) {
            throw CheckError(WRITE_ERROR, output_path, x.what());
        }

        return similarity;
    } catch (const std::exception &) {
        // Whatever went wrong, the output file must not be left missing or stale.
        ResultWriter::WriteFallback(output_path);
        throw;
    }
}
