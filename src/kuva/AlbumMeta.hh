/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/12/26.
//

#pragma once

#include "util/Exception.hh"
#include "common/FS.hh"

#include <optional>
#include <string>
#include <string_view>

namespace kuva {

/// \brief  Declared metadata of an album, i.e. the content of album.toml
/// Only the title is required. A missing timespan will be derived from EXIF.
struct AlbumMeta
{
	struct Error : virtual Exception {};

	std::string                 title;
	std::optional<std::string>  description;
	std::optional<std::string>  timespan;

	static AlbumMeta load(const fs::path& file);
	static AlbumMeta parse(std::string_view content, const fs::path& source);
};

/// site.toml at the data root
struct SiteMeta
{
	struct Error : virtual Exception {};

	std::string                 title;
	std::optional<std::string>  footer_snippet;

	static SiteMeta load(const fs::path& file);
	static SiteMeta parse(std::string_view content, const fs::path& source);
};

} // end of namespace kuva
