/** \file    FileUtil.cc
 *  \brief   Implementation of file-related utility functions.
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
#include "FileUtil.h"
#include <exception>
#include <fstream>
#include <iterator>
#include <vector>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix, const bool cleanup_if_exception_is_active,
                                     const bool remove_when_out_of_scope)
    : cleanup_if_exception_is_active_(cleanup_if_exception_is_active), remove_when_out_of_scope_(remove_when_out_of_scope)
{
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(const_cast<char *>(path_template.c_str())));
    if (path == nullptr)
        LOG_ERROR("mkdtemp(3) for path prefix \"" + path_prefix + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        LOG_ERROR("realpath(3) for path \"" + std::string(path) + "\" failed!");
    path_ = resolved_path;
}


AutoTempDirectory::~AutoTempDirectory() {
    if (not IsDirectory(path_))
        LOG_ERROR("\"" + path_ + "\" doesn't exist anymore!");

    if (remove_when_out_of_scope_ and ((not std::uncaught_exceptions() or cleanup_if_exception_is_active_)
                                       and not RemoveDirectory(path_)))
        LOG_ERROR("can't remove \"" + path_ + "\"!");
}


static bool Stat(struct stat * const stat_buf, const std::string &path, std::string * const error_message) {
    errno = 0;

    if (::stat(path.c_str(), stat_buf) != 0) {
        if (error_message != nullptr)
            *error_message = "can't stat(2) \"" + path + "\": " + std::string(::strerror(errno));
        errno = 0;
        return false;
    }

    return true;
}


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    return Stat(&stat_buf, path, error_message);
}


bool IsRegularFile(const std::string &path) {
    struct stat stat_buf;
    if (not Stat(&stat_buf, path, nullptr))
        return false;

    return S_ISREG(stat_buf.st_mode);
}


bool IsDirectory(const std::string &dir_name) {
    struct stat stat_buf;
    if (not Stat(&stat_buf, dir_name, nullptr))
        return false;

    return S_ISDIR(stat_buf.st_mode);
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    output.close();
    return not output.fail();
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    data->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return not input.bad();
}


bool MakeDirectory(const std::string &path, const bool recursive, const mode_t mode) {
    if (unlikely(path.empty()))
        return false;

    // In NON-recursive mode we make a single attempt to create the directory:
    if (not recursive) {
        errno = 0;
        if (::mkdir(path.c_str(), mode) == 0)
            return true;
        const bool dir_exists(errno == EEXIST and IsDirectory(path));
        if (dir_exists)
            errno = 0;
        return dir_exists;
    }

    std::vector<std::string> path_components;
    StringUtil::Split(path, '/', &path_components, /* suppress_empty_components = */ true);

    std::string path_so_far(path[0] == '/' ? "/" : "");
    for (const auto &path_component : path_components) {
        path_so_far += path_component;
        path_so_far += '/';
        errno = 0;
        if (::mkdir(path_so_far.c_str(), mode) == -1 and errno != EEXIST)
            return false;
        if (errno == EEXIST and not IsDirectory(path_so_far))
            return false;
    }

    errno = 0;
    return true;
}


static void CloseDirWhilePreservingErrno(DIR * const dir_handle) {
    const int old_errno(errno);
    ::closedir(dir_handle);
    errno = old_errno;
}


bool RemoveDirectory(const std::string &dir_name) {
    errno = 0;
    DIR *dir_handle(::opendir(dir_name.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;

        const std::string path(dir_name + "/" + std::string(entry->d_name));
        if (entry->d_type == DT_DIR) {
            if (unlikely(not RemoveDirectory(path))) {
                CloseDirWhilePreservingErrno(dir_handle);
                return false;
            }
        } else if (unlikely(::unlink(path.c_str()) != 0)) {
            CloseDirWhilePreservingErrno(dir_handle);
            return false;
        }
    }
    if (unlikely(errno != 0)) { // readdir(2) failed!
        CloseDirWhilePreservingErrno(dir_handle);
        return false;
    }

    if (unlikely(::rmdir(dir_name.c_str()) != 0)) {
        CloseDirWhilePreservingErrno(dir_handle);
        return false;
    }

    return likely(::closedir(dir_handle) == 0);
}


std::string GetDirname(const std::string &path) {
    const auto last_slash_pos(path.rfind('/'));
    if (last_slash_pos == std::string::npos)
        return "";
    return path.substr(0, last_slash_pos);
}


std::string MakeAbsolutePath(const std::string &base_directory, const std::string &path) {
    if (base_directory.empty() or StringUtil::StartsWith(path, "/"))
        return path;
    return base_directory + "/" + path;
}


} // namespace FileUtil
