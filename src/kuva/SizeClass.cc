/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/10/26.
//

#include "SizeClass.hh"

#include "common/Error.hh"

#include <cassert>

namespace kuva {

std::string_view to_string(SizeClass size)
{
	switch (size)
	{
		case SizeClass::small:  return "small";
		case SizeClass::medium: return "medium";
	}
	assert(false);
	return {};
}

std::optional<SizeClass> parse_size_class(std::string_view name)
{
	for (auto size : all_size_classes)
	{
		if (to_string(size) == name)
			return size;
	}
	return std::nullopt;
}

SizeClass parse_size_class(std::string_view name, std::error_code& ec)
{
	auto size = parse_size_class(name);
	if (!size)
	{
		ec = Error::invalid_size_class;
		return SizeClass::small;
	}

	ec.clear();
	return *size;
}

const JPEGSizeSetting& SizeClassSetting::find(SizeClass size) const
{
	auto index = static_cast<std::size_t>(size);
	assert(index < m_sizes.size());
	return m_sizes[index];
}

void SizeClassSetting::assign(SizeClass size, const JPEGSizeSetting& setting)
{
	auto index = static_cast<std::size_t>(size);
	assert(index < m_sizes.size());
	m_sizes[index] = setting;
}

} // end of namespace kuva
