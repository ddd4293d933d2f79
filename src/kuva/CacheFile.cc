/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created by nestal on 3/14/26.
//

#include "CacheFile.hh"

#include "util/Log.hh"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>

namespace kuva {

CacheFile::~CacheFile()
{
	boost::system::error_code ec;
	if (m_file.is_open())
		m_file.close(ec);

	if (!m_tmp_path.empty())
	{
		std::error_code rm_ec;
		fs::remove(m_tmp_path, rm_ec);
		if (rm_ec)
			Log(LOG_WARNING, "cannot remove temporary file %1%: %2%", m_tmp_path, rm_ec.message());
	}
}

bool CacheFile::is_open() const
{
	return m_file.is_open();
}

void CacheFile::open(const fs::path& dest, std::error_code& ec)
{
	// Hidden, so that it will never be mistaken as a photo. The name is short
	// because the destination may already be as long as the filesystem allows.
	auto tmp = (dest.parent_path() / ".tmp-XXXXXX").string();
	int fd = ::mkstemp(&tmp[0]);
	if (fd < 0)
	{
		ec.assign(errno, std::generic_category());
		return;
	}

	m_tmp_path = tmp;
	m_dest     = dest;
	m_file.native_handle(fd);

	// mkstemp() creates the file with 0600
	if (::fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) != 0)
		ec.assign(errno, std::generic_category());
	else
		ec.clear();
}

std::size_t CacheFile::write(BufferView data, std::error_code& ec)
{
	ec.clear();
	std::size_t total = 0;
	while (total < data.size())
	{
		boost::system::error_code bec;
		auto count = m_file.write(data.data() + total, data.size() - total, bec);
		if (bec)
		{
			ec.assign(bec.value(), std::generic_category());
			break;
		}
		total += count;
	}
	return total;
}

void CacheFile::modified_time(const struct timespec& mtime, std::error_code& ec)
{
	struct timespec times[2] = {{0, UTIME_OMIT}, mtime};
	if (::futimens(m_file.native_handle(), times) != 0)
		ec.assign(errno, std::generic_category());
	else
		ec.clear();
}

void CacheFile::publish(std::error_code& ec)
{
	if (m_tmp_path.empty() || !m_file.is_open())
	{
		ec.assign(EBADF, std::generic_category());
		return;
	}

	if (::fsync(m_file.native_handle()) != 0)
	{
		ec.assign(errno, std::generic_category());
		return;
	}

	boost::system::error_code bec;
	m_file.close(bec);
	if (bec)
	{
		ec.assign(bec.value(), std::generic_category());
		return;
	}

	fs::rename(m_tmp_path, m_dest, ec);
	if (!ec)
		m_tmp_path.clear();
}

} // end of namespace kuva
