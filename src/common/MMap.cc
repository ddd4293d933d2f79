/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created by nestal on 3/9/26.
//

// Application headers
#include "MMap.hh"

// Boost library
#include <boost/beast/core/file_posix.hpp>

// Standard C++ library
#include <cassert>
#include <cerrno>
#include <utility>

// Linux/POSIX specific
#include <sys/mman.h>
#include <sys/stat.h>

namespace kuva {

MMap MMap::open(int fd, std::error_code& ec)
{
	MMap result;

	struct stat s{};
	if (::fstat(fd, &s) != 0)
		ec.assign(errno, std::generic_category());

	// mmap() refuses zero-length mappings
	else if (s.st_size == 0)
		ec.clear();

	else
		result.mmap(fd, static_cast<std::size_t>(s.st_size), ec);

	return result;
}

MMap MMap::open(const fs::path& path, std::error_code& ec)
{
	MMap result;

	boost::system::error_code bec;
	boost::beast::file_posix file;
	file.open(path.string().c_str(), boost::beast::file_mode::read, bec);
	if (bec)
		ec.assign(bec.value(), std::generic_category());
	else
		result = open(file.native_handle(), ec);

	return result;
}

void MMap::mmap(int fd, std::size_t size, std::error_code& ec)
{
	assert(!is_opened());
	auto addr = ::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
	if (addr == MAP_FAILED)
	{
		m_mmap = nullptr;
		m_size = 0;
		ec.assign(errno, std::generic_category());
	}
	else
	{
		m_mmap = addr;
		m_size = size;
		ec.clear();
	}
}

MMap::~MMap()
{
	if (is_opened())
		clear();
}

void MMap::clear()
{
	assert(is_opened());
	::munmap(m_mmap, m_size);
	m_mmap = nullptr;
	m_size = 0;
}

void MMap::swap(MMap& target) noexcept
{
	std::swap(m_mmap, target.m_mmap);
	std::swap(m_size, target.m_size);
}

MMap::MMap(MMap&& m) noexcept
{
	swap(m);
	assert(!m.is_opened());
}

MMap& MMap::operator=(MMap&& rhs) noexcept
{
	MMap copy{std::move(rhs)};
	swap(copy);
	return *this;
}

} // end of namespace
