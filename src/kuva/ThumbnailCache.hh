/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/14/26.
//

#pragma once

#include "SizeClass.hh"
#include "common/FS.hh"
#include "common/MMap.hh"

#include <atomic>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

struct stat;

namespace kuva {

/// \brief  Generates resized JPEG copies of the photos on demand and keeps them on disk
///
/// The cache lives in its own directory, laid out as <cache root>/<album>/<size>/<file>.jpg.
/// Names too long for the filesystem keep a prefix and get a digest of the full name instead.
/// The photos root is never written to. A cache entry carries the modification time of its
/// source, rounded up to whole 2-second steps, and is valid as long as the source is not newer
/// at that granularity.
///
/// get_or_create() can be called from multiple threads. Requests for the same key are
/// serialized so that a thumbnail is generated only once.
class ThumbnailCache
{
public:
	ThumbnailCache(fs::path photos_root, fs::path cache_root, const SizeClassSetting& sizes = {});
	ThumbnailCache(const ThumbnailCache&) = delete;
	ThumbnailCache& operator=(const ThumbnailCache&) = delete;

	MMap get_or_create(std::string_view album, std::string_view filename, SizeClass size, std::error_code& ec);

	[[nodiscard]] fs::path cache_path(std::string_view album, std::string_view filename, SizeClass size) const;
	[[nodiscard]] const fs::path& cache_root() const {return m_cache_root;}

	[[nodiscard]] std::size_t hits() const {return m_hits;}
	[[nodiscard]] std::size_t generated() const {return m_generated;}

	static struct timespec stamp(const struct timespec& source_mtime);
	static bool is_fresh(const struct timespec& source_mtime, const struct timespec& cached_mtime);
	static std::string cache_filename(std::string_view filename);

private:
	MMap find_fresh(const fs::path& cached, const struct stat& source) const;
	MMap generate(int source_fd, const struct stat& source, const fs::path& dest, SizeClass size, std::error_code& ec);
	std::shared_ptr<std::mutex> key_lock(const std::string& key);

private:
	fs::path            m_photos_root;
	fs::path            m_cache_root;
	SizeClassSetting    m_sizes;

	std::mutex m_table_mutex;
	std::unordered_map<std::string, std::weak_ptr<std::mutex>> m_in_flight;

	std::atomic<std::size_t> m_hits{0};
	std::atomic<std::size_t> m_generated{0};
};

} // end of namespace kuva
