/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/13/26.
//

#include "Album.hh"
#include "AlbumMeta.hh"
#include "Timespan.hh"

#include <algorithm>

namespace kuva {

std::optional<std::string> Album::cover() const
{
	return photos.empty() ? std::nullopt : std::optional<std::string>{photos.front().filename};
}

AlbumSummary Album::summary() const
{
	return {slug, title, description, timespan, cover(), photos.size()};
}

std::optional<std::size_t> Album::find(std::string_view filename) const
{
	auto it = std::find_if(photos.begin(), photos.end(), [filename](auto&& photo){return photo.filename == filename;});
	return it != photos.end() ? std::optional<std::size_t>{it - photos.begin()} : std::nullopt;
}

Album resolve_album(const fs::path& album_dir, std::vector<Photo> photos)
{
	auto meta = AlbumMeta::load(album_dir / "album.toml");

	Album album;
	album.slug          = album_dir.filename().string();
	album.title         = std::move(meta.title);
	album.description   = std::move(meta.description);
	album.timespan      = meta.timespan ? std::move(*meta.timespan) : derive_timespan(album_dir, photos);
	album.photos        = std::move(photos);
	return album;
}

} // end of namespace kuva
