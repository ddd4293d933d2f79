/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/10/26.
//

#pragma once

#include "util/Size2D.hh"

#include <array>
#include <optional>
#include <string_view>
#include <system_error>

namespace kuva {

/// \brief  Target sizes of the generated thumbnails
/// The set is closed: requests cannot ask for arbitrary dimensions, which
/// keeps the number of cache entries per photo bounded.
enum class SizeClass
{
	small,      //!< grid thumbnail
	medium      //!< detail view
};

constexpr std::array<SizeClass, 2> all_size_classes{SizeClass::small, SizeClass::medium};

std::string_view to_string(SizeClass size);
std::optional<SizeClass> parse_size_class(std::string_view name);
SizeClass parse_size_class(std::string_view name, std::error_code& ec);

struct JPEGSizeSetting
{
	Size2D  dim;
	int     quality{85};
};

class SizeClassSetting
{
public:
	SizeClassSetting() = default;

	[[nodiscard]] const JPEGSizeSetting& find(SizeClass size) const;
	[[nodiscard]] Size2D dimension(SizeClass size) const {return find(size).dim;}
	[[nodiscard]] int quality(SizeClass size) const {return find(size).quality;}

	void assign(SizeClass size, const JPEGSizeSetting& setting);

private:
	std::array<JPEGSizeSetting, all_size_classes.size()> m_sizes{
		JPEGSizeSetting{{400, 400}, 85},
		JPEGSizeSetting{{1200, 1200}, 85}
	};
};

} // end of namespace kuva
