/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/13/26.
//

#include "AlbumRepository.hh"
#include "AlbumMeta.hh"

#include "common/Error.hh"
#include "util/Log.hh"

#include <boost/exception/get_error_info.hpp>

#include <algorithm>

namespace kuva {

fs::path album_directory(const fs::path& photos_root, const fs::path& cache_root, std::string_view slug, std::error_code& ec)
{
	if (!is_safe_path_segment(slug) || is_hidden(slug) || !is_url_safe(slug))
	{
		ec = Error::album_not_found;
		return {};
	}

	auto dir = photos_root / std::string{slug};
	boost::system::error_code bec;
	if (!fs::is_directory(dir, bec) || fs::equivalent(dir, cache_root, bec))
	{
		ec = Error::album_not_found;
		return {};
	}

	try
	{
		AlbumMeta::load(dir / "album.toml");
	}
	catch (AlbumMeta::Error&)
	{
		ec = Error::album_metadata_invalid;
		return {};
	}

	ec.clear();
	return dir;
}

AlbumRepository::AlbumRepository(fs::path photos_root, fs::path cache_root) :
	m_photos_root{std::move(photos_root)},
	m_cache_root{std::move(cache_root)}
{
}

std::vector<std::string> AlbumRepository::album_dirs() const
{
	std::vector<std::string> result;

	boost::system::error_code ec;
	for (auto it = fs::directory_iterator{m_photos_root, ec} ; !ec && it != fs::directory_iterator{} ; it.increment(ec))
	{
		auto name = it->path().filename().string();
		if (is_hidden(name) || !is_directory(it->status()))
			continue;

		// the cache may be configured to live inside the photos root
		boost::system::error_code eq_ec;
		if (fs::equivalent(it->path(), m_cache_root, eq_ec))
			continue;

		result.push_back(std::move(name));
	}
	if (ec)
		Log(LOG_WARNING, "cannot list albums in %1%: %2%", m_photos_root, ec.message());

	std::sort(result.begin(), result.end());
	return result;
}

Album AlbumRepository::load(const std::string& slug, std::error_code& ec, std::string& message) const
{
	if (!is_url_safe(slug))
	{
		ec = Error::invalid_album_name;
		message = ec.message();
		return {};
	}

	auto dir = m_photos_root / slug;
	auto photos = list_photos(dir, ec);
	if (ec)
	{
		message = "cannot list photos: " + ec.message();
		ec = Error::album_metadata_invalid;
		return {};
	}

	try
	{
		auto album = resolve_album(dir, std::move(photos));
		ec.clear();
		return album;
	}
	catch (AlbumMeta::Error& e)
	{
		auto msg = boost::get_error_info<ErrorMessage>(e);
		message = msg ? *msg : std::string{"invalid album.toml"};
		if (auto code = boost::get_error_info<ErrorCode>(e))
			message += ": " + code->message();

		ec = Error::album_metadata_invalid;
		return {};
	}
}

std::vector<Album> AlbumRepository::list_albums(std::vector<AlbumWarning>& warnings) const
{
	std::vector<Album> result;
	for (auto&& slug : album_dirs())
	{
		std::error_code ec;
		std::string message;
		auto album = load(slug, ec, message);
		if (ec)
		{
			Log(LOG_WARNING, "album \"%1%\" skipped: %2%", slug, message);
			warnings.push_back({slug, ec, std::move(message)});
		}
		else
			result.push_back(std::move(album));
	}
	return result;
}

Album AlbumRepository::get_album(std::string_view slug, std::error_code& ec) const
{
	// album.toml is parsed again by load() to get the error message
	album_directory(m_photos_root, m_cache_root, slug, ec);
	if (ec == Error::album_not_found)
		return {};

	std::string message;
	auto album = load(std::string{slug}, ec, message);
	if (ec)
		Log(LOG_WARNING, "album \"%1%\" cannot be loaded: %2%", slug, message);
	return album;
}

fs::path AlbumRepository::directory(std::string_view slug, std::error_code& ec) const
{
	return album_directory(m_photos_root, m_cache_root, slug, ec);
}

} // end of namespace kuva
