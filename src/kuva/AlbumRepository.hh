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

#include "Album.hh"
#include "common/FS.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kuva {

/// An album that was left out of the catalog, and why.
struct AlbumWarning
{
	std::string     slug;
	std::error_code error;
	std::string     message;
};

/// \brief  Directory of the album named by \a slug, if the catalog lists it
/// Slugs that cannot name an album give Error::album_not_found. These are unsafe,
/// hidden or non-URL-safe names, the cache root and anything that is not a directory.
/// An album.toml that is missing or invalid gives Error::album_metadata_invalid.
fs::path album_directory(const fs::path& photos_root, const fs::path& cache_root, std::string_view slug, std::error_code& ec);

/// \brief  Catalog of albums under the photos root
/// Every call scans the file system again. Nothing is cached so concurrent
/// calls need no locking.
class AlbumRepository
{
public:
	AlbumRepository(fs::path photos_root, fs::path cache_root);

	/// Albums sorted by directory name. Albums that cannot be resolved are
	/// skipped and reported in \a warnings.
	std::vector<Album> list_albums(std::vector<AlbumWarning>& warnings) const;

	Album get_album(std::string_view slug, std::error_code& ec) const;

	/// Photos and thumbnails are served only from the directories returned here.
	fs::path directory(std::string_view slug, std::error_code& ec) const;

	[[nodiscard]] const fs::path& photos_root() const {return m_photos_root;}

private:
	std::vector<std::string> album_dirs() const;
	Album load(const std::string& slug, std::error_code& ec, std::string& message) const;

private:
	fs::path m_photos_root;
	fs::path m_cache_root;
};

} // end of namespace kuva
