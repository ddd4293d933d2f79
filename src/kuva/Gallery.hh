/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/15/26.
//

#pragma once

#include "AlbumMeta.hh"
#include "AlbumRepository.hh"
#include "ThumbnailCache.hh"

#include "image/EXIF2.hh"
#include "util/Exception.hh"

#include <optional>
#include <string>
#include <vector>

namespace kuva {

class Configuration;

struct Site
{
	std::string                 title;
	std::optional<std::string>  footer_snippet;
	std::vector<AlbumSummary>   albums;
};

/// A photo in the context of its album.
struct PhotoView
{
	Album           album;
	std::size_t     index{};
	ExifSummary     exif;

	[[nodiscard]] const Photo& photo() const {return album.photos.at(index);}
	[[nodiscard]] std::optional<Photo> prev() const;
	[[nodiscard]] std::optional<Photo> next() const;
};

/// \brief  Everything the rendering layer needs from the data and cache roots
/// The data root must exist and contain a valid site.toml, otherwise the
/// constructor throws. After that, failures only affect the request concerned.
class Gallery
{
public:
	struct Error : virtual Exception {};

public:
	explicit Gallery(const Configuration& cfg);

	[[nodiscard]] Site site(std::vector<AlbumWarning>& warnings) const;
	[[nodiscard]] const SiteMeta& site_meta() const {return m_site;}

	std::vector<AlbumSummary> list_albums(std::vector<AlbumWarning>& warnings) const;
	std::vector<AlbumSummary> list_albums() const;

	Album get_album(std::string_view slug, std::error_code& ec) const;
	PhotoView get_photo(std::string_view slug, std::string_view filename, std::error_code& ec) const;

	MMap get_thumbnail(std::string_view slug, std::string_view filename, SizeClass size, std::error_code& ec);
	MMap get_thumbnail(std::string_view slug, std::string_view filename, std::string_view size, std::error_code& ec);

	/// The source photo as it is, for download.
	MMap original(std::string_view slug, std::string_view filename, std::error_code& ec) const;

	[[nodiscard]] const AlbumRepository& repository() const {return m_repo;}
	ThumbnailCache& thumbnails() {return m_thumbnails;}

private:
	fs::path            m_data_root;
	SiteMeta            m_site;
	AlbumRepository     m_repo;
	ThumbnailCache      m_thumbnails;
};

} // end of namespace kuva
