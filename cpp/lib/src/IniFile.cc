/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::replace(const std::string &variable_name, const std::string &value, const std::string &comment) {
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value, comment);
    else {
        existing_entry->value_ = value;
        existing_entry->comment_ = comment;
    }
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("in IniFile::Section::getString: can't find \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("in IniFile::Section::getUnsigned: can't find \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    unsigned number;
    if (unlikely(not StringUtil::ToUnsigned(existing_entry->value_, &number)))
        throw std::runtime_error("in IniFile::Section::getUnsigned: invalid unsigned entry \"" + variable_name
                                 + "\" in section \"" + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    if (not hasEntry(variable_name))
        return default_value;

    return getUnsigned(variable_name);
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name) {
    processFile(ini_file_name_);
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header" + getLocation());

    std::string section_name(line.substr(1, line.length() - 2));
    StringUtil::Trim(" \t", &section_name);
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name" + getLocation());

    if (std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend())
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\"" + getLocation());
    sections_.emplace_back(section_name);
}


void IniFile::processInclude(const std::string &line) {
    if (unlikely(line.find('=') != std::string::npos))
        throw std::runtime_error("in IniFile::processInclude: unexpected '='" + getLocation());

    std::string include_filename(line.substr(__builtin_strlen("include")));
    StringUtil::Trim(" \t", &include_filename);
    if (include_filename[0] == '"') {
        if (include_filename.length() < 3 or include_filename[include_filename.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processInclude: garbled include file name" + getLocation());
        include_filename = include_filename.substr(1, include_filename.length() - 2);
    }

    processFile(FileUtil::MakeAbsolutePath(FileUtil::GetDirname(getCurrentFile()), include_filename));
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores and periods.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


std::string StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if ((*character == '#' or *character == ';') and not inside_string_literal) {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped comment characters

            const auto comment_start_pos(static_cast<size_t>(character - line->begin()));
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return *line;
        }
    }

    return *line;
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos)
        throw std::runtime_error("in IniFile::processSectionEntry: expected \"name = value\"" + getLocation());

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\"" + getLocation());

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value" + getLocation());

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value" + getLocation());
        value = value.substr(1, value.length() - 2);
    }

    sections_.back().replace(variable_name, value, comment);
}


void IniFile::processFile(const std::string &filename) {
    if (unlikely(not FileUtil::Exists(filename)))
        throw std::runtime_error("in IniFile::processFile: file \"" + filename + "\" does not exist!");
    std::ifstream ini_file(filename.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + filename + "\"! (" + std::string(::strerror(errno)) + ")");

    include_file_infos_.push(IncludeFileInfo(filename));

    std::string buf;
    while (std::getline(ini_file, buf)) {
        ++getCurrentLineNo();
        std::string line(StringUtil::Trim(" \t\r", buf));

        // read further lines as long as the current one ends in a backslash
        while (not line.empty() and line[line.length() - 1] == '\\' and std::getline(ini_file, buf)) {
            ++getCurrentLineNo();
            line = StringUtil::Trim(" \t", line.substr(0, line.length() - 1)) + StringUtil::Trim(" \t\r", buf);
        }

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty()) // skip blank and comment-only lines
            continue;

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else if (line.length() > 7 and line.substr(0, 7) == "include" and (line[7] == ' ' or line[7] == '\t'))
            processInclude(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, comment);
        }
    }

    include_file_infos_.pop();
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    return section == sections_.cend() ? nullptr : &*section;
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    if (section == nullptr) {
        s->clear();
        return false;
    }

    return section->lookup(variable_name, s);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == nullptr)
        throw std::runtime_error("in IniFile::getString: no such section: \"" + section_name + "\"! (variable: \""
                                 + variable_name + "\")");

    return section->getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name,
                               const std::string &default_value) const
{
    const auto section(getSection(section_name));
    if (section == nullptr)
        return default_value;

    return section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == nullptr)
        throw std::runtime_error("in IniFile::getUnsigned: no such section: \"" + section_name + "\"! (variable: \""
                                 + variable_name + "\")");

    return section->getUnsigned(variable_name);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const auto section(getSection(section_name));
    if (section == nullptr)
        return default_value;

    return section->getUnsigned(variable_name, default_value);
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.getSectionName());

    return section_names;
}
