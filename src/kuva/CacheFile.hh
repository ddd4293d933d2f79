/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created by nestal on 3/14/26.
//

#pragma once

#include "common/BufferView.hh"
#include "common/FS.hh"

#include <boost/beast/core/file_posix.hpp>

#include <ctime>
#include <system_error>

namespace kuva {

/// \brief  A file in the thumbnail cache that is not visible until published
/// The content is written to a temporary file next to the destination, which is
/// renamed over the destination by publish(). Readers see either the old file or
/// the complete new one. The temporary file is removed if it is never published.
class CacheFile
{
public:
	CacheFile() = default;
	CacheFile(const CacheFile&) = delete;
	CacheFile(CacheFile&&) = default;
	~CacheFile();

	CacheFile& operator=(const CacheFile&) = delete;
	CacheFile& operator=(CacheFile&&) = default;

	bool is_open() const;

	void open(const fs::path& dest, std::error_code& ec);

	std::size_t write(BufferView data, std::error_code& ec);

	/// Set the modification time of the file. The access time is not touched.
	void modified_time(const struct timespec& mtime, std::error_code& ec);

	void publish(std::error_code& ec);

	const fs::path& temp_path() const {return m_tmp_path;}

private:
	boost::beast::file_posix    m_file;
	fs::path                    m_tmp_path;
	fs::path                    m_dest;
};

} // end of namespace kuva
