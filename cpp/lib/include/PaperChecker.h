/** \file    PaperChecker.h
 *  \brief   Pairwise document similarity for plagiarism checks.
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
#pragma once


#include <stdexcept>
#include <string>
#include <vector>
#include "PaperCheckerDefaults.h"
#include "Segmenter.h"
#include "TextNormaliser.h"
#include "TfIdfVectoriser.h"


/** \class  PaperChecker
 *  \brief  Compares two documents by cleaning, segmenting and filtering them and then taking the cosine of their
 *          TF-IDF vectors.
 *  \note   All members are immutable after construction, so a single instance may be shared between threads.
 */
class PaperChecker {
public:
    enum ErrorKind { NOT_FOUND, DECODE_ERROR, EMPTY_CONTENT, WRITE_ERROR };

    /** Thrown by checkPlagiarism() after the fallback result has been written. */
    class CheckError: public std::runtime_error {
        ErrorKind kind_;
        std::string path_;
    public:
        CheckError(const ErrorKind kind, const std::string &path, const std::string &message)
            : std::runtime_error(message), kind_(kind), path_(path) { }

        inline ErrorKind getKind() const { return kind_; }
        inline const std::string &getPath() const { return path_; }

        /** \return True for errors that are caused by one of the input files. */
        inline bool isFileError() const { return kind_ != WRITE_ERROR; }
    };

    struct Config {
        StopWordSet stop_words_;
        std::vector<std::string> academic_lexicon_;
        SegmentationDictionary segmentation_dictionary_;
        unsigned max_features_;
        unsigned min_token_length_;
    public:
        /** \return The built-in word lists and limits. */
        static Config Defaults();

        /** \brief Starts with Defaults() and overrides whatever is set in the "Similarity" and "Dictionaries"
         *         sections of "ini_file_path".  Relative dictionary paths are resolved against the directory that
         *         contains the configuration file.
         *  \throws std::runtime_error if the file or one of the files it references can't be read or contains invalid
         *          values.
         */
        static Config FromIniFile(const std::string &ini_file_path);
    };
private:
    TextNormaliser normaliser_;
    Segmenter segmenter_;
    TfIdfVectoriser vectoriser_;
public:
    explicit PaperChecker(const Config &config = Config::Defaults());
    virtual ~PaperChecker() = default;

    /** \brief Runs "text" through cleaning, segmentation and token filtering. */
    std::vector<std::string> preprocess(const std::string &text) const;

    /** \return A score in [0,1], rounded to four decimal places.  Empty or unusable texts score 0.0.
     *  \note   Never throws for any text input.
     */
    virtual double calculateSimilarity(const std::string &text1, const std::string &text2) const;

    /** \brief Loads both documents, compares them and writes the score to "output_path".
     *  \return The score that was written.
     *  \throws CheckError if an input can't be loaded or the result can't be written.  Any other exception is passed
     *          on unchanged.  In either case "output_path" contains the fallback value, provided that it is writable at
     *          all.
     */
    double checkPlagiarism(const std::string &original_path, const std::string &copy_path,
                           const std::string &output_path) const;
private:
    std::string loadDocument(const std::string &path) const;
};
