/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/12/26.
//

#include "PhotoList.hh"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace kuva {

namespace {

struct ImageType
{
	std::string_view extension;
	std::string_view mime;
};

const std::array<ImageType, 4> image_types{{
	{".jpg",  "image/jpeg"},
	{".jpeg", "image/jpeg"},
	{".png",  "image/png"},
	{".webp", "image/webp"}
}};

const ImageType* find_type(std::string_view filename)
{
	auto it = std::find_if(image_types.begin(), image_types.end(), [filename](auto&& type)
	{
		return filename.size() > type.extension.size() && boost::algorithm::iends_with(filename, type.extension);
	});
	return it != image_types.end() ? &*it : nullptr;
}

} // end of anonymous namespace

bool is_safe_path_segment(std::string_view segment)
{
	return !segment.empty() && segment != "." && segment != ".." &&
		segment.find_first_of(std::string_view{"/\\\0", 3}) == segment.npos;
}

bool is_url_safe(std::string_view segment)
{
	return is_safe_path_segment(segment) && std::all_of(segment.begin(), segment.end(), [](char c)
	{
		return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_' || c == '~';
	});
}

bool is_hidden(std::string_view filename)
{
	return !filename.empty() && filename.front() == '.';
}

bool is_supported_image(std::string_view filename)
{
	return is_safe_path_segment(filename) && !is_hidden(filename) && find_type(filename) != nullptr;
}

std::string_view mime_type(std::string_view filename)
{
	auto type = find_type(filename);
	return type ? type->mime : "application/octet-stream";
}

std::vector<Photo> list_photos(const fs::path& album_dir, std::error_code& ec)
{
	std::vector<Photo> result;
	auto slug = album_dir.filename().string();

	boost::system::error_code bec;
	for (auto it = fs::directory_iterator{album_dir, bec} ; !bec && it != fs::directory_iterator{} ; it.increment(bec))
	{
		auto filename = it->path().filename().string();
		if (is_supported_image(filename) && is_regular_file(it->status()))
			result.push_back(Photo{slug, std::move(filename)});
	}
	if (bec)
	{
		ec.assign(bec.value(), std::generic_category());
		return {};
	}

	std::sort(result.begin(), result.end(), [](auto&& a, auto&& b){return a.filename < b.filename;});
	ec.clear();
	return result;
}

} // end of namespace kuva
