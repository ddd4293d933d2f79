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

#include "common/FS.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kuva {

/// A photo has no identity other than its file name inside its album.
struct Photo
{
	std::string album;      //!< slug of the owning album
	std::string filename;

	bool operator==(const Photo& other) const {return album == other.album && filename == other.filename;}
	bool operator!=(const Photo& other) const {return !(*this == other);}
};

/// Rejects empty names, "." and "..", and anything with a path separator or NUL.
bool is_safe_path_segment(std::string_view segment);

/// Only unreserved characters of RFC 3986: letters, digits, '-', '.', '_' and '~'.
bool is_url_safe(std::string_view segment);

bool is_hidden(std::string_view filename);

/// JPEG, PNG or WebP by extension (case-insensitive), and not a hidden file.
bool is_supported_image(std::string_view filename);

std::string_view mime_type(std::string_view filename);

/// \brief  Lists the photos in an album directory
/// Only regular files with a supported image extension are returned, sorted by file name
/// so that the order does not depend on the file system. Sub-directories (including a
/// cache directory placed inside the album) and hidden files are skipped.
std::vector<Photo> list_photos(const fs::path& album_dir, std::error_code& ec);

} // end of namespace kuva
