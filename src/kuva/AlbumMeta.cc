/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/12/26.
//

#include "AlbumMeta.hh"

#include "common/MMap.hh"
#include "config.hh"

#include <boost/exception/info.hpp>
#include <toml++/toml.hpp>

#include <sstream>

namespace kuva {
namespace {

template <typename ErrorType>
toml::table parse_table(std::string_view content, const fs::path& source)
{
	try
	{
		return toml::parse(content, source.string());
	}
	catch (toml::parse_error& e)
	{
		std::ostringstream msg;
		msg << e.description() << " (line " << e.source().begin.line << ")";
		BOOST_THROW_EXCEPTION(ErrorType() << ErrorMessage{msg.str()} << ErrorPath{source});
	}
}

template <typename ErrorType>
std::string read_file(const fs::path& file)
{
	std::error_code ec;
	auto mmap = MMap::open(file, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(ErrorType() << ErrorCode{ec} << ErrorPath{file} << ErrorMessage{"cannot read file"});

	return std::string{mmap.string()};
}

// An optional string field. Present but not a string is an error.
template <typename ErrorType>
std::optional<std::string> string_field(const toml::table& table, std::string_view key, const fs::path& source)
{
	auto node = table[key];
	if (!node)
		return std::nullopt;

	if (!node.is_string())
		BOOST_THROW_EXCEPTION(ErrorType()
			<< ErrorMessage{"\"" + std::string{key} + "\" must be a string"}
			<< ErrorPath{source}
		);

	return node.value<std::string>();
}

} // end of local namespace

AlbumMeta AlbumMeta::load(const fs::path& file)
{
	return parse(read_file<Error>(file), file);
}

AlbumMeta AlbumMeta::parse(std::string_view content, const fs::path& source)
{
	auto table = parse_table<Error>(content, source);

	auto title = string_field<Error>(table, "title", source);
	if (!title || title->empty())
		BOOST_THROW_EXCEPTION(Error() << ErrorMessage{"missing album title"} << ErrorPath{source});

	AlbumMeta result;
	result.title        = std::move(*title);
	result.description  = string_field<Error>(table, "description", source);
	result.timespan     = string_field<Error>(table, "timespan", source);
	return result;
}

SiteMeta SiteMeta::load(const fs::path& file)
{
	return parse(read_file<Error>(file), file);
}

SiteMeta SiteMeta::parse(std::string_view content, const fs::path& source)
{
	auto table = parse_table<Error>(content, source);

	SiteMeta result;
	result.title            = string_field<Error>(table, "title", source).value_or(std::string{constants::default_site_title});
	result.footer_snippet   = string_field<Error>(table, "footer_snippet", source);
	return result;
}

} // end of namespace kuva
