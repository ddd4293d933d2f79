/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

#include "kuva/Gallery.hh"
#include "common/Error.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"
#include "config.hh"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace kuva {
namespace {

void print_warnings(const std::vector<AlbumWarning>& warnings)
{
	for (auto&& warning : warnings)
		std::cerr << "warning: album \"" << warning.slug << "\" skipped: " << warning.message << "\n";
}

int list(const Gallery& gallery)
{
	std::vector<AlbumWarning> warnings;
	auto site = gallery.site(warnings);

	std::cout << site.title << "\n";
	for (auto&& album : site.albums)
	{
		std::cout << "  " << album.slug << "\t" << album.title << "\t" << album.photo_count << " photos";
		if (!album.timespan.empty())
			std::cout << "\t" << album.timespan;
		std::cout << "\n";
	}
	print_warnings(warnings);
	return EXIT_SUCCESS;
}

int show_album(const Gallery& gallery, const std::string& slug)
{
	std::error_code ec;
	auto album = gallery.get_album(slug, ec);
	if (ec)
	{
		std::cerr << slug << ": " << ec.message() << "\n";
		return EXIT_FAILURE;
	}

	std::cout << album.title << "\n";
	if (album.description)
		std::cout << *album.description << "\n";
	if (!album.timespan.empty())
		std::cout << album.timespan << "\n";

	for (auto&& photo : album.photos)
	{
		auto raw = gallery.original(slug, photo.filename, ec);
		std::cout << "  " << photo.filename;
		if (EXIF2 exif{raw.buffer()}; !ec && exif)
			std::cout << "\t" << exif.summary().str();
		std::cout << "\n";
	}
	return EXIT_SUCCESS;
}

int thumbnail(Gallery& gallery, const std::vector<std::string>& args, const std::optional<fs::path>& output)
{
	std::error_code ec;
	auto jpeg = gallery.get_thumbnail(args.at(0), args.at(1), args.at(2), ec);
	if (ec)
	{
		std::cerr << args.at(0) << "/" << args.at(1) << ": " << ec.message() << "\n";
		return EXIT_FAILURE;
	}

	if (output)
	{
		std::ofstream file{output->string(), std::ios::out | std::ios::binary};
		if (!file.write(jpeg.string().data(), static_cast<std::streamsize>(jpeg.size())))
		{
			std::cerr << "cannot write to " << *output << "\n";
			return EXIT_FAILURE;
		}
	}
	else
		std::cout.write(jpeg.string().data(), static_cast<std::streamsize>(jpeg.size()));

	return EXIT_SUCCESS;
}

// Generate all thumbnails of all albums in advance.
int warm(Gallery& gallery, std::size_t threads)
{
	std::vector<AlbumWarning> warnings;
	auto albums = gallery.repository().list_albums(warnings);
	print_warnings(warnings);

	std::atomic<std::size_t> failed{0}, total{0};
	boost::asio::thread_pool pool{std::max<std::size_t>(1, threads)};
	for (auto&& album : albums)
		for (auto&& photo : album.photos)
			for (auto size : all_size_classes)
			{
				boost::asio::post(pool, [&gallery, &failed, &total, photo, size]
				{
					std::error_code ec;
					gallery.get_thumbnail(photo.album, photo.filename, size, ec);
					if (ec)
					{
						Log(LOG_WARNING, "cannot generate %1% thumbnail of %2%/%3%: %4%",
							to_string(size), photo.album, photo.filename, ec.message());
						++failed;
					}
					++total;
				});
			}
	pool.join();

	std::cout << total << " thumbnails, " << gallery.thumbnails().generated() << " generated, "
		<< gallery.thumbnails().hits() << " up-to-date, " << failed << " failed\n";
	return failed > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}

int run(const Configuration& cfg)
{
	Log(LOG_NOTICE, "kuvasivu (version %1%) starting", constants::version);
	Gallery gallery{cfg};

	auto&& args = cfg.arguments();
	if (cfg.command() == "list")
		return list(gallery);

	else if (cfg.command() == "album" && args.size() == 1)
		return show_album(gallery, args.front());

	else if (cfg.command() == "thumbnail" && args.size() == 3)
		return thumbnail(gallery, args, cfg.output());

	else if (cfg.command() == "warm")
		return warm(gallery, cfg.thread_count());

	std::cerr << "Usage: kuvasivu [options] list | album <slug> | thumbnail <slug> <file> <small|medium> | warm\n";
	cfg.usage(std::cerr);
	return EXIT_FAILURE;
}

} // end of local namespace
} // end of namespace

int main(int argc, char *argv[])
{
	using namespace kuva;
	try
	{
		Configuration cfg{argc, argv, ::getenv("KUVASIVU_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		return run(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		std::cerr << boost::diagnostic_information(e) << "\n";
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		std::cerr << e.what() << "\n";
		return EXIT_FAILURE;
	}
	catch (...)
	{
		Log(LOG_CRIT, "Uncaught unknown exception");
		return EXIT_FAILURE;
	}
}
