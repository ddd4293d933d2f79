/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/14/26.
//

#include "ThumbnailCache.hh"
#include "AlbumRepository.hh"
#include "CacheFile.hh"
#include "PhotoList.hh"

#include "common/Error.hh"
#include "image/Image.hh"
#include "util/Log.hh"

#include <boost/beast/core/file_posix.hpp>
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cerrno>
#include <climits>
#include <sys/stat.h>

namespace kuva {
namespace {

// FAT keeps modification times in 2-second steps. Every filesystem the cache
// may live on can store a multiple of it exactly.
const std::time_t stamp_granularity = 2;

// Keep a readable prefix of long names. The rest is replaced by a digest of
// the whole name.
const std::size_t long_name_prefix = 200;

} // end of local namespace

struct timespec ThumbnailCache::stamp(const struct timespec& source_mtime)
{
	auto sec = source_mtime.tv_sec;
	if (source_mtime.tv_nsec > 0)
		++sec;

	// round up to the next step, also for times before 1970
	auto rem = sec % stamp_granularity;
	if (rem != 0)
		sec += rem > 0 ? stamp_granularity - rem : -rem;

	return {sec, 0};
}

bool ThumbnailCache::is_fresh(const struct timespec& source_mtime, const struct timespec& cached_mtime)
{
	// Compare in whole steps, so that the truncation done by a coarse filesystem
	// does not make the entry look older than its source.
	auto cached = cached_mtime.tv_sec - ((cached_mtime.tv_sec % stamp_granularity) + stamp_granularity) % stamp_granularity;
	return stamp(source_mtime).tv_sec <= cached;
}

std::string ThumbnailCache::cache_filename(std::string_view filename)
{
	const std::string_view suffix{".jpg"};
	if (filename.size() + suffix.size() <= NAME_MAX)
		return std::string{filename}.append(suffix);

	// do not cut a UTF-8 sequence in half
	auto cut = long_name_prefix;
	while (cut > 0 && (static_cast<unsigned char>(filename[cut]) & 0xC0) == 0x80)
		--cut;

	boost::uuids::name_generator_sha1 digest{boost::uuids::ns::url()};
	auto id = digest(filename.data(), filename.size());

	return std::string{filename.substr(0, cut)}.append("~").append(boost::uuids::to_string(id)).append(suffix);
}

ThumbnailCache::ThumbnailCache(fs::path photos_root, fs::path cache_root, const SizeClassSetting& sizes) :
	m_photos_root{std::move(photos_root)},
	m_cache_root{std::move(cache_root)},
	m_sizes{sizes}
{
}

fs::path ThumbnailCache::cache_path(std::string_view album, std::string_view filename, SizeClass size) const
{
	return m_cache_root / std::string{album} / std::string{to_string(size)} / cache_filename(filename);
}

MMap ThumbnailCache::get_or_create(std::string_view album, std::string_view filename, SizeClass size, std::error_code& ec)
{
	// only the albums in the catalog
	auto album_dir = album_directory(m_photos_root, m_cache_root, album, ec);
	if (ec)
	{
		ec = Error::album_not_found;
		return {};
	}

	if (!is_supported_image(filename))
	{
		ec = Error::photo_not_found;
		return {};
	}

	boost::system::error_code bec;
	boost::beast::file_posix source;
	source.open((album_dir / std::string{filename}).string().c_str(), boost::beast::file_mode::read, bec);
	if (bec)
	{
		if (bec.value() == ENOENT || bec.value() == ENOTDIR)
			ec = Error::photo_not_found;
		else
			ec.assign(bec.value(), std::generic_category());
		return {};
	}

	struct stat source_stat{};
	if (::fstat(source.native_handle(), &source_stat) != 0)
	{
		ec.assign(errno, std::generic_category());
		return {};
	}
	if (!S_ISREG(source_stat.st_mode))
	{
		ec = Error::photo_not_found;
		return {};
	}

	auto dest = cache_path(album, filename, size);
	if (auto cached = find_fresh(dest, source_stat); cached.is_opened())
	{
		Log(LOG_DEBUG, "thumbnail cache hit: %1%", dest);
		++m_hits;
		ec.clear();
		return cached;
	}

	// Only one thread generates a given thumbnail. The others wait and then
	// find it in the cache.
	auto key_mutex = key_lock(dest.string());
	std::unique_lock lock{*key_mutex};

	if (auto cached = find_fresh(dest, source_stat); cached.is_opened())
	{
		++m_hits;
		ec.clear();
		return cached;
	}

	return generate(source.native_handle(), source_stat, dest, size, ec);
}

MMap ThumbnailCache::find_fresh(const fs::path& cached, const struct stat& source) const
{
	boost::system::error_code bec;
	boost::beast::file_posix file;
	file.open(cached.string().c_str(), boost::beast::file_mode::read, bec);
	if (bec)
		return {};

	struct stat cached_stat{};
	if (::fstat(file.native_handle(), &cached_stat) != 0 || !is_fresh(source.st_mtim, cached_stat.st_mtim))
		return {};

	std::error_code ec;
	auto mmap = MMap::open(file.native_handle(), ec);
	if (ec)
		Log(LOG_WARNING, "cannot map cached thumbnail %1%: %2%", cached, ec.message());
	return mmap;
}

MMap ThumbnailCache::generate(int source_fd, const struct stat& source, const fs::path& dest, SizeClass size, std::error_code& ec)
{
	fs::create_directories(dest.parent_path(), ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot create cache directory %1%: %2%", dest.parent_path(), ec.message());
		ec = Error::cache_write_failure;
		return {};
	}

	auto raw = MMap::open(source_fd, ec);
	if (ec)
		return {};

	auto image = load_image(raw.buffer());
	if (image.empty())
	{
		Log(LOG_WARNING, "cannot decode source image of %1%", dest);
		ec = Error::image_decode_failure;
		return {};
	}

	auto jpeg = encode_jpeg(resize_to_fit(image, m_sizes.dimension(size)), m_sizes.quality(size));
	if (jpeg.empty())
	{
		Log(LOG_WARNING, "cannot encode thumbnail %1%", dest);
		ec = Error::image_encode_failure;
		return {};
	}

	CacheFile file;
	file.open(dest, ec);
	if (!ec)
		file.write({jpeg.data(), jpeg.size()}, ec);
	if (!ec)
		file.modified_time(stamp(source.st_mtim), ec);
	if (!ec)
		file.publish(ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot write thumbnail %1%: %2%", dest, ec.message());
		ec = Error::cache_write_failure;
		return {};
	}

	++m_generated;
	Log(LOG_INFO, "generated thumbnail %1% from %2%x%3% source (%4% bytes)", dest, image.cols, image.rows, jpeg.size());

	auto result = MMap::open(dest, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot map generated thumbnail %1%: %2%", dest, ec.message());
		ec = Error::cache_write_failure;
	}
	return result;
}

std::shared_ptr<std::mutex> ThumbnailCache::key_lock(const std::string& key)
{
	std::unique_lock lock{m_table_mutex};

	// forget the keys that nobody is working on
	for (auto it = m_in_flight.begin() ; it != m_in_flight.end() ; )
	{
		if (it->second.expired())
			it = m_in_flight.erase(it);
		else
			++it;
	}

	auto& entry = m_in_flight[key];
	auto mutex = entry.lock();
	if (!mutex)
	{
		mutex = std::make_shared<std::mutex>();
		entry = mutex;
	}
	return mutex;
}

} // end of namespace kuva
