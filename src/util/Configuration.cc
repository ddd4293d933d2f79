/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created by nestal on 3/10/26.
//

#include "Configuration.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <cerrno>
#include <fstream>
#include <ostream>

namespace po = boost::program_options;

namespace kuva {
namespace {

std::string environment_option(const std::string& variable)
{
	if (variable == "KUVASIVU_DATA_DIR")  return "data-root";
	if (variable == "KUVASIVU_CACHE_DIR") return "cache-root";
	if (variable == "KUVASIVU_THREADS")   return "threads";
	return {};
}

} // end of local namespace

Configuration::Configuration(fs::path data_root, fs::path cache_root) :
	m_data_root{std::move(data_root)},
	m_cache_root{std::move(cache_root)}
{
}

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	using namespace std::literals;
	m_desc.add_options()
		("help",       "produce help message")
		("cfg",        po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable KUVASIVU_CONFIG to set default path.")
		("data-root",  po::value<std::string>()->default_value(m_data_root.string())->value_name("path"),
			"Directory containing site.toml and photos/ (KUVASIVU_DATA_DIR)")
		("cache-root", po::value<std::string>()->default_value(m_cache_root.string())->value_name("path"),
			"Writable directory for generated thumbnails (KUVASIVU_CACHE_DIR)")
		("threads",    po::value<std::size_t>()->default_value(m_thread_count)->value_name("count"),
			"Number of worker threads used by \"warm\" (KUVASIVU_THREADS)")
		("output",     po::value<std::string>()->value_name("path"), "Output file of the \"thumbnail\" command")
		("command",    po::value<std::string>()->default_value("list"), "list, album, thumbnail or warm")
		("argument",   po::value<std::vector<std::string>>(), "arguments of the command")
	;
	m_positional.add("command", 1).add("argument", -1);

	if (argc > 0)
		store(po::command_line_parser(argc, argv).options(m_desc).positional(m_positional).run(), m_args);
	store(po::parse_environment(m_desc, &environment_option), m_args);
	po::notify(m_args);

	// no need for other options when --help is specified
	if (help())
		return;

	// the default configuration file is optional, but one that is asked for must exist
	auto cfg = fs::path{m_args["cfg"].as<std::string>()};
	if (!m_args["cfg"].defaulted() || env || exists(cfg))
		load_config(cfg);

	if (!m_args["data-root"].defaulted())
		m_data_root = m_args["data-root"].as<std::string>();
	if (!m_args["cache-root"].defaulted())
		m_cache_root = m_args["cache-root"].as<std::string>();
	if (!m_args["threads"].defaulted())
		m_thread_count = m_args["threads"].as<std::size_t>();

	m_command = m_args["command"].as<std::string>();
	if (m_args.count("argument") > 0)
		m_arguments = m_args["argument"].as<std::vector<std::string>>();
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

std::optional<fs::path> Configuration::output() const
{
	return m_args.count("output") > 0 ?
		std::optional<fs::path>{m_args["output"].as<std::string>()} :
		std::nullopt;
}

void Configuration::load_config(const fs::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::generic_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		// Paths are relative to the configuration file
		auto base = absolute(path).parent_path();
		if (auto root = json.value(jptr{"/data_root"}, std::string{}); !root.empty())
			m_data_root  = weakly_canonical(absolute(root, base));
		if (auto root = json.value(jptr{"/cache_root"}, std::string{}); !root.empty())
			m_cache_root = weakly_canonical(absolute(root, base));

		m_thread_count = json.value(jptr{"/thread_count"}, m_thread_count);

		if (json.contains("size_class"))
		{
			for (auto&& size : json["size_class"].items())
			{
				auto sc = parse_size_class(size.key());
				if (!sc)
					BOOST_THROW_EXCEPTION(Error() << Message{"unknown size class \"" + size.key() + "\""});

				auto current = m_size_classes.find(*sc);
				auto max_dim = size.value().value("max_dimension", current.dim.width());
				auto quality = size.value().value("quality", current.quality);
				if (max_dim <= 0 || quality <= 0 || quality > 100)
					BOOST_THROW_EXCEPTION(Error() << Message{"invalid setting for size class \"" + size.key() + "\""});

				m_size_classes.assign(*sc, {{max_dim, max_dim}, quality});
			}
		}
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{path});
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
}

} // end of namespace
