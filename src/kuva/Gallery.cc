/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/15/26.
//

#include "Gallery.hh"

#include "common/Error.hh"
#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>

#include <algorithm>
#include <cerrno>
#include <iterator>

namespace kuva {

std::optional<Photo> PhotoView::prev() const
{
	return index > 0 ? std::optional<Photo>{album.photos.at(index-1)} : std::nullopt;
}

std::optional<Photo> PhotoView::next() const
{
	return index + 1 < album.photos.size() ? std::optional<Photo>{album.photos.at(index+1)} : std::nullopt;
}

Gallery::Gallery(const Configuration& cfg) :
	m_data_root{cfg.data_root()},
	m_repo{cfg.photos_root(), cfg.cache_root()},
	m_thumbnails{cfg.photos_root(), cfg.cache_root(), cfg.size_classes()}
{
	boost::system::error_code bec;
	auto status = fs::status(m_data_root, bec);
	if (!fs::is_directory(status))
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorPath{m_data_root}
			<< ErrorCode{std::error_code{
				bec ? bec.value() : (fs::exists(status) ? ENOTDIR : ENOENT),
				std::generic_category()
			}}
			<< ErrorMessage{"data root is not a directory"}
		);

	m_site = SiteMeta::load(cfg.site_file());

	// Not fatal: the photos may be browsed without thumbnails.
	std::error_code ec;
	fs::create_directories(cfg.cache_root(), ec);
	if (ec)
		Log(LOG_WARNING, "cannot create cache root %1%: %2%", cfg.cache_root(), ec.message());

	Log(LOG_NOTICE, "serving \"%1%\" from %2% with cache in %3%", m_site.title, m_data_root, cfg.cache_root());
}

Site Gallery::site(std::vector<AlbumWarning>& warnings) const
{
	return {m_site.title, m_site.footer_snippet, list_albums(warnings)};
}

std::vector<AlbumSummary> Gallery::list_albums(std::vector<AlbumWarning>& warnings) const
{
	auto albums = m_repo.list_albums(warnings);

	std::vector<AlbumSummary> result;
	std::transform(albums.begin(), albums.end(), std::back_inserter(result), [](auto&& album){return album.summary();});
	return result;
}

std::vector<AlbumSummary> Gallery::list_albums() const
{
	// the warnings are logged by the repository
	std::vector<AlbumWarning> warnings;
	return list_albums(warnings);
}

Album Gallery::get_album(std::string_view slug, std::error_code& ec) const
{
	return m_repo.get_album(slug, ec);
}

PhotoView Gallery::get_photo(std::string_view slug, std::string_view filename, std::error_code& ec) const
{
	PhotoView result;
	result.album = m_repo.get_album(slug, ec);
	if (ec)
		return {};

	auto index = result.album.find(filename);
	if (!index)
	{
		ec = Error::photo_not_found;
		return {};
	}
	result.index = *index;

	auto raw = original(slug, filename, ec);
	if (ec)
		return {};

	result.exif = EXIF2{raw.buffer()}.summary();
	return result;
}

MMap Gallery::get_thumbnail(std::string_view slug, std::string_view filename, SizeClass size, std::error_code& ec)
{
	return m_thumbnails.get_or_create(slug, filename, size, ec);
}

MMap Gallery::get_thumbnail(std::string_view slug, std::string_view filename, std::string_view size, std::error_code& ec)
{
	auto sc = parse_size_class(size, ec);
	return ec ? MMap{} : get_thumbnail(slug, filename, sc, ec);
}

MMap Gallery::original(std::string_view slug, std::string_view filename, std::error_code& ec) const
{
	auto album_dir = m_repo.directory(slug, ec);
	if (ec)
	{
		ec = Error::album_not_found;
		return {};
	}

	boost::system::error_code bec;
	if (!is_supported_image(filename) || !fs::is_regular_file(album_dir / std::string{filename}, bec))
	{
		ec = Error::photo_not_found;
		return {};
	}

	auto result = MMap::open(album_dir / std::string{filename}, ec);
	if (ec == std::errc::no_such_file_or_directory)
		ec = Error::photo_not_found;
	return result;
}

} // end of namespace kuva
