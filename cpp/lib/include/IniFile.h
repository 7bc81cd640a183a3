/** \file    IniFile.h
 *  \brief   Declaration of class IniFile, a reader for Windows-style configuration files.
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
#pragma once


#include <algorithm>
#include <stack>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Reads "[section]" headers, "name = value" entries, "include file" directives and comments that start
 *          with '#' or ';'.  Entries in front of the first section header go into a section with an empty name.
 *  \note   All errors, syntactic or semantic, are reported by throwing a std::runtime_error.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;
    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;
    public:
        typedef std::vector<Entry>::const_iterator const_iterator;
    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        /** \brief Adds a new entry or, if "variable_name" is already defined, overwrites it. */
        void replace(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \throws  A std::runtime_error if the variable is not found. */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws  A std::runtime_error if the variable is not found or the value cannot be converted to an unsigned. */
        unsigned getUnsigned(const std::string &variable_name) const;

        /** \throws  A std::runtime_error if the value was found but cannot be converted to an unsigned. */
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;
protected:
    Sections sections_;
    std::string ini_file_name_;

    struct IncludeFileInfo {
        std::string filename_;
        unsigned current_lineno_;
    public:
        explicit IncludeFileInfo(const std::string &filename): filename_(filename), current_lineno_(0) { }
    };
    std::stack<IncludeFileInfo> include_file_infos_;
public:
    /** \brief  Construct an IniFile based on the named file.
     *  \throws std::runtime_error if the file or one of its includes can't be read or is malformed.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    /** \return The name of the file used to construct the object. */
    const std::string &getFilename() const { return ini_file_name_; }

    /** \return The section named "section_name" or nullptr if there is no such section. */
    const Section *getSection(const std::string &section_name) const;

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name,
                          const std::string &default_value) const;

    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;

    std::vector<std::string> getSections() const;
private:
    void processFile(const std::string &filename);
    void processSectionHeader(const std::string &line);
    void processInclude(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);

    inline unsigned &getCurrentLineNo() { return include_file_infos_.top().current_lineno_; }
    inline const std::string &getCurrentFile() const { return include_file_infos_.top().filename_; }
    std::string getLocation() { return " on line " + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!"; }
};
