/** \file    FileUtil.h
 *  \brief   Declaration of file-related utility functions.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <string>
#include <sys/stat.h>
#include <sys/types.h>


namespace FileUtil {


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and removes it when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool cleanup_if_exception_is_active_;
    bool remove_when_out_of_scope_;
public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD", const bool cleanup_if_exception_is_active = true,
                               const bool remove_when_out_of_scope = true);
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory();

    const std::string &getDirectoryPath() const { return path_; }
};


/** \return True if "path" can be stat(2)'ed, else false.  If "error_message" is not NULL it will be set to a
 *          description of the problem.
 */
bool Exists(const std::string &path, std::string * const error_message = nullptr);


/** \return True if "path" refers to a regular file (symlinks are followed). */
bool IsRegularFile(const std::string &path);


// IsDirectory -- Is the specified file a directory?
bool IsDirectory(const std::string &dir_name);


bool WriteString(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);


/** \brief  Create a directory.
 *  \param  path       The path to create.
 *  \param  recursive  If true, attempt to recursively create parent directories too.
 *  \param  mode       The access permission for the directory/directories that will be created.
 *  \return True if the directory already existed or has been created else false.
 */
bool MakeDirectory(const std::string &path, const bool recursive = false, const mode_t mode = 0755);


/** \brief  Recursively delete a directory.
 *  \param  dir_name  The directory to delete.
 *  \return True if the directory was deleted else false.
 */
bool RemoveDirectory(const std::string &dir_name);


/** \return The directory part of "path" or the empty string if there is no slash in "path". */
std::string GetDirname(const std::string &path);


/** \return "path" itself if it is absolute or "base_directory" is empty, else "base_directory/path". */
std::string MakeAbsolutePath(const std::string &base_directory, const std::string &path);


} // namespace FileUtil
