/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <map>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the lookup and get* methods.  Double-quoted string
 *  constants can use C-style character backslash escapes like \\n.  If you want to embed a hash mark in an unquoted
 *  string you must preceede it with a single backslash.  In order to extend a value over multiple lines, put backslashes
 *  just before the line ends on all but the last line.  Entries that precede the first section header belong to the
 *  section with the empty name.
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

        // \note Aborts on a duplicate "variable_name".
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \brief   Retrieves a string value.
         *  \note    If the variable is not defined in the section, the program aborts.
         */
        std::string getString(const std::string &variable_name) const;

        // \return The value of "variable_name" or "default_value" if it is not defined.
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves a boolean value.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \note    The expected values for the variable are case insensitive and can be any of "true", "yes", "on"
         *           "false", "no" or "off".  Any other value aborts the program.
         */
        bool getBool(const std::string &variable_name, const bool default_value) const;

        /** \brief   Retrieves a non-negative integer value.
         *  \note    A value that is not a valid unsigned number aborts the program.
         */
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \brief   Retrieves an enum value.
         *  \param   variable_name        The name of the section entry to read.
         *  \param   string_to_value_map  A mapping of allowable string constants in the config file, to integer values.
         *  \param   default_value        A default to return if the variable is not defined.
         *  \note    The expected values are case sensitive.  The caller will have to use a static_cast to convert the
         *           int-encoded enum to a variable of the approriate enumerated type.  An unknown value aborts the program.
         */
        int getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                    const int default_value) const;

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

public:
    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    unsigned current_lineno_;

public:
    /** \brief  Construct an IniFile based on the named file.
     *  \param  ini_file_name           The name of the .ini file.
     *  \param  treat_missing_as_empty  If true, a missing file results in an IniFile without sections instead of an
     *                                  exception.
     *  \throws std::runtime_error if the file can't be read or contains a syntax error.
     */
    explicit IniFile(const std::string &ini_file_name, const bool treat_missing_as_empty = false);

    /** \return The path of the program-specific configuration file.  The file lives in BibTools::GetConfigPath()
     *          and is named X.conf, where "X" is the program's basename.
     */
    static std::string DefaultIniFileName();

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    const std::string &getFilename() const { return ini_file_name_; }

    // \return An iterator referencing the found section or end() if no matching section exists.
    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }

    // \return The named section or an empty section of that name if the file has no such section.
    Section getSectionOrEmpty(const std::string &section_name) const;

    std::vector<std::string> getSections() const;

private:
    void processFile();
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
    std::string locationInfo() const;
};
