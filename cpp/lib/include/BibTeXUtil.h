/** \file    BibTeXUtil.h
 *  \brief   Rewriting of fields in BibTeX databases.
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


#include <string>
#include <vector>
#include "TitleNormalizer.h"


namespace BibTeXUtil {


struct RewriteStats {
    unsigned title_count_;   // Fields that were passed through the pipeline.
    unsigned changed_count_; // Fields whose value was changed by the pipeline.

public:
    RewriteStats(): title_count_(0), changed_count_(0) { }
};


/** \brief  Runs the values of all brace-delimited fields named "field_names" through "pipeline".
 *  \param  document            The contents of a BibTeX file.
 *  \param  field_names         Field names are compared case-insensitively, e.g. "title" also matches "TITLE".
 *  \param  rewritten_document  A copy of "document" with the normalised values.  Everything but the field values
 *                              is preserved byte for byte.
 *  \note   A field value extends to the closing brace that balances its opening brace.  Values without a balancing
 *          brace are left alone.
 *  \throws std::runtime_error if the pipeline throws, if "field_names" is empty or if the field search fails.
 */
RewriteStats NormalizeTitleFields(const std::string &document, TitleNormalizer::Pipeline * const pipeline,
                                  const std::vector<std::string> &field_names, std::string * const rewritten_document);


} // namespace BibTeXUtil
