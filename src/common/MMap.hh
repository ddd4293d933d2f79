/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created by nestal on 3/9/26.
//

#pragma once

#include "BufferView.hh"
#include "FS.hh"

#include <cstddef>
#include <string_view>
#include <system_error>

namespace kuva {

/// \brief  Read-only memory mapped file
/// The mapping stays valid after the file is closed, renamed over or removed,
/// so a thumbnail can be served while another thread replaces it in the cache.
class MMap
{
public:
	MMap() = default;
	MMap(MMap&&) noexcept ;
	MMap(const MMap&) = delete;
	MMap& operator=(MMap&&) noexcept ;
	MMap& operator=(const MMap&) = delete;
	~MMap();

	static MMap open(int fd, std::error_code& ec);
	static MMap open(const fs::path& path, std::error_code& ec);

	[[nodiscard]] const void* data() const {return m_mmap;}
	[[nodiscard]] std::size_t size() const {return m_size;}

	[[nodiscard]] std::string_view string() const {return {static_cast<const char*>(m_mmap), m_size};}
	[[nodiscard]] BufferView buffer() const {return {static_cast<const unsigned char*>(m_mmap), m_size};}

	[[nodiscard]] bool is_opened() const {return m_mmap != nullptr;}
	void clear();
	void swap(MMap& target) noexcept ;

private:
	void mmap(int fd, std::size_t size, std::error_code& ec);

private:
	void *m_mmap{};         //!< Pointer to memory mapped file
	std::size_t m_size{};   //!< File size in bytes.
};

} // end of namespace
