/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created by nestal on 3/10/26.
//

#pragma once

#include "Exception.hh"
#include "common/FS.hh"
#include "kuva/SizeClass.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/exception/error_info.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace kuva {

/// \brief  Parsing command line options, environment and configuration file
/// Command line options take precedence over environment variables (KUVASIVU_DATA_DIR,
/// KUVASIVU_CACHE_DIR and KUVASIVU_THREADS), which take precedence over the JSON
/// configuration file. The data root may be read-only. Only the cache root is written to.
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	using Path      = ErrorPath;
	using Message   = ErrorMessage;

public:
	Configuration() = default;
	Configuration(fs::path data_root, fs::path cache_root);
	Configuration(int argc, const char *const *argv, const char *env);

	[[nodiscard]] const fs::path& data_root() const {return m_data_root;}
	[[nodiscard]] const fs::path& cache_root() const {return m_cache_root;}
	[[nodiscard]] fs::path photos_root() const {return m_data_root / "photos";}
	[[nodiscard]] fs::path site_file() const {return m_data_root / "site.toml";}
	[[nodiscard]] std::size_t thread_count() const {return m_thread_count;}
	[[nodiscard]] const SizeClassSetting& size_classes() const {return m_size_classes;}

	[[nodiscard]] bool help() const {return m_args.count("help") > 0;}
	[[nodiscard]] const std::string& command() const {return m_command;}
	[[nodiscard]] const std::vector<std::string>& arguments() const {return m_arguments;}
	[[nodiscard]] std::optional<fs::path> output() const;

	void usage(std::ostream& out) const;

private:
	void load_config(const fs::path& path);

private:
	boost::program_options::options_description             m_desc{"Allowed options"};
	boost::program_options::positional_options_description  m_positional;
	boost::program_options::variables_map                   m_args;

	fs::path    m_data_root{"."};
	fs::path    m_cache_root{"cache"};
	std::size_t m_thread_count{1};

	std::string m_command;
	std::vector<std::string> m_arguments;

	SizeClassSetting m_size_classes;
};

} // end of namespace
