/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/13/26.
//

#pragma once

#include "PhotoList.hh"

#include <optional>
#include <string>
#include <vector>

namespace kuva {

struct AlbumSummary
{
	std::string                 slug;
	std::string                 title;
	std::optional<std::string>  description;
	std::string                 timespan;
	std::optional<std::string>  cover;          //!< file name of the cover photo
	std::size_t                 photo_count{};
};

/// \brief  An album with its effective metadata
/// Declared values from album.toml take precedence over derived ones. The slug
/// is the name of the album directory.
struct Album
{
	std::string                 slug;
	std::string                 title;
	std::optional<std::string>  description;
	std::string                 timespan;       //!< empty if unknown
	std::vector<Photo>          photos;

	[[nodiscard]] std::optional<std::string> cover() const;
	[[nodiscard]] AlbumSummary summary() const;

	// Index of the photo in display order
	[[nodiscard]] std::optional<std::size_t> find(std::string_view filename) const;
};

/// Reads album.toml and merges it with the timespan derived from the photos.
/// Throws AlbumMeta::Error if album.toml is missing or invalid.
Album resolve_album(const fs::path& album_dir, std::vector<Photo> photos);

} // end of namespace kuva
