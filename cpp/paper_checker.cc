/** \brief Utility for computing the similarity between an original paper and a possibly plagiarised copy.
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
#include <iostream>
#include <cstdlib>
#include "PaperChecker.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] original_path copy_path output_path\n"
            "The similarity, a number between 0.00 and 1.00, will be written to \"output_path\".\n"
            "If the comparison fails, \"output_path\" will contain 0.00.");
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_file_path;
    if (StringUtil::StartsWith(argv[1], "--config-file=")) {
        config_file_path = argv[1] + __builtin_strlen("--config-file=");
        if (config_file_path.empty())
            Usage();
        --argc, ++argv;
    }

    if (argc != 4)
        Usage();

    const std::string original_path(argv[1]), copy_path(argv[2]), output_path(argv[3]);
    if (original_path.empty() or copy_path.empty() or output_path.empty())
        LOG_ERROR("file paths must not be empty!");

    const PaperChecker paper_checker(config_file_path.empty() ? PaperChecker::Config::Defaults()
                                                              : PaperChecker::Config::FromIniFile(config_file_path));

    LOG_INFO("original: " + original_path);
    LOG_INFO("copy: " + copy_path);
    LOG_INFO("output: " + output_path);

    double similarity;
    try {
        similarity = paper_checker.checkPlagiarism(original_path, copy_path, output_path);
    } catch (const PaperChecker::CheckError &check_error) {
        if (check_error.isFileError())
            LOG_ERROR("file error: " + std::string(check_error.what()));
        LOG_ERROR("error: " + std::string(check_error.what()));
    }

    std::cout << "Similarity: " << StringUtil::ToFixedPointString(similarity * 100.0, 2) << "%\n";
    LOG_INFO("result written to " + output_path);

    return EXIT_SUCCESS;
}
