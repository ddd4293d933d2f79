/*
	Copyright © 2026 The kuvasivu developers
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created on 3/17/26.
//

#include <catch2/catch.hpp>

#include "kuva/AlbumRepository.hh"
#include "common/Error.hh"
#include "TestImages.hh"

using namespace kuva;

class AlbumRepositoryUTFixture
{
public:
	AlbumRepositoryUTFixture()
	{
		fs::remove_all(m_root);
		fs::create_directories(m_photos);
	}

protected:
	fs::path album(const std::string& slug, std::string_view toml)
	{
		auto dir = m_photos / slug;
		fs::create_directories(dir);
		test::write_file(dir / "album.toml", toml);
		return dir;
	}

	static test::ExifFields taken(const char *exif)
	{
		test::ExifFields fields;
		fields.date_time_original = exif;
		return fields;
	}

protected:
	const fs::path m_root{"/tmp/AlbumRepository-UT"};
	const fs::path m_photos{m_root / "photos"};
	const fs::path m_cache{m_root / "cache"};

	AlbumRepository m_subject{m_photos, m_cache};
};

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "albums are sorted by directory name", "[normal]")
{
	for (auto slug : {"c-album", "a-album", "b-album"})
	{
		auto dir = album(slug, "title = \"Title of " + std::string{slug} + "\"");
		test::write_file(dir / "x.jpg", test::jpeg_image(16, 16));
	}

	std::vector<AlbumWarning> warnings;
	auto albums = m_subject.list_albums(warnings);
	REQUIRE(warnings.empty());
	REQUIRE(albums.size() == 3);
	REQUIRE(albums[0].slug == "a-album");
	REQUIRE(albums[0].title == "Title of a-album");
	REQUIRE(albums[1].slug == "b-album");
	REQUIRE(albums[2].slug == "c-album");

	SECTION("same order every time")
	{
		for (int i = 0; i < 5; ++i)
		{
			std::vector<AlbumWarning> again_warnings;
			auto again = m_subject.list_albums(again_warnings);
			REQUIRE(again.size() == albums.size());
			for (std::size_t j = 0; j < again.size(); ++j)
				REQUIRE(again[j].slug == albums[j].slug);
		}
	}
}

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "a broken album does not hide the others", "[error]")
{
	album("good", "title = \"Good\"");
	album("broken", "title = \"unterminated");
	fs::create_directories(m_photos / "no-toml");
	album("untitled", "description = \"where is my title?\"");

	std::vector<AlbumWarning> warnings;
	auto albums = m_subject.list_albums(warnings);
	REQUIRE(albums.size() == 1);
	REQUIRE(albums.front().slug == "good");

	REQUIRE(warnings.size() == 3);
	REQUIRE(warnings[0].slug == "broken");
	REQUIRE(warnings[1].slug == "no-toml");
	REQUIRE(warnings[2].slug == "untitled");
	for (auto&& warning : warnings)
	{
		REQUIRE(warning.error == Error::album_metadata_invalid);
		REQUIRE(!warning.message.empty());
	}
}

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "declared timespan overrides EXIF", "[normal]")
{
	auto declared = album("declared", "title = \"Declared\"\ntimespan = \"Summer of '69\"");
	test::write_file(declared / "a.jpg", test::jpeg_image(16, 16, 0, taken("2024:03:01 10:00:00")));

	auto derived = album("derived", "title = \"Derived\"");
	test::write_file(derived / "a.jpg", test::jpeg_image(16, 16, 0, taken("2024:03:01 10:00:00")));
	test::write_file(derived / "b.jpg", test::jpeg_image(16, 16, 1, taken("2024:05:31 10:00:00")));

	auto undated = album("undated", "title = \"Undated\"");
	test::write_file(undated / "a.jpg", test::jpeg_image(16, 16));

	std::error_code ec;
	REQUIRE(m_subject.get_album("declared", ec).timespan == "Summer of '69");
	REQUIRE(!ec);
	REQUIRE(m_subject.get_album("derived", ec).timespan == "March 2024 – May 2024");
	REQUIRE(!ec);
	REQUIRE(m_subject.get_album("undated", ec).timespan.empty());
	REQUIRE(!ec);
}

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "album contents", "[normal]")
{
	auto dir = album("my-album", "title = \"My Album\"\ndescription = \"desc\"");
	test::write_file(dir / "b.jpg", test::jpeg_image(16, 16));
	test::write_file(dir / "a.jpg", test::jpeg_image(16, 16));
	test::write_file(dir / "readme.txt", "hello");

	std::error_code ec;
	auto subject = m_subject.get_album("my-album", ec);
	REQUIRE(!ec);
	REQUIRE(subject.slug == "my-album");
	REQUIRE(subject.title == "My Album");
	REQUIRE(subject.description == "desc");
	REQUIRE(subject.photos.size() == 2);
	REQUIRE(subject.cover() == "a.jpg");
	REQUIRE(subject.find("b.jpg") == 1U);
	REQUIRE_FALSE(subject.find("readme.txt").has_value());

	auto summary = subject.summary();
	REQUIRE(summary.slug == "my-album");
	REQUIRE(summary.cover == "a.jpg");
	REQUIRE(summary.photo_count == 2);

	SECTION("empty album has no cover")
	{
		album("empty", "title = \"Empty\"");
		auto empty = m_subject.get_album("empty", ec);
		REQUIRE(!ec);
		REQUIRE(empty.photos.empty());
		REQUIRE_FALSE(empty.cover().has_value());
	}
}

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "directories that are not albums", "[normal]")
{
	album("visible", "title = \"Visible\"");
	album(".hidden", "title = \"Hidden\"");
	album("has space", "title = \"Space\"");
	test::write_file(m_photos / "stray.jpg", test::jpeg_image(16, 16));

	std::vector<AlbumWarning> warnings;
	auto albums = m_subject.list_albums(warnings);
	REQUIRE(albums.size() == 1);
	REQUIRE(albums.front().slug == "visible");

	REQUIRE(warnings.size() == 1);
	REQUIRE(warnings.front().slug == "has space");
	REQUIRE(warnings.front().error == Error::invalid_album_name);

	// the excluded ones cannot be reached by name either
	std::error_code ec;
	m_subject.get_album("has space", ec);
	REQUIRE(ec == Error::album_not_found);
	m_subject.directory("has space", ec);
	REQUIRE(ec == Error::album_not_found);
	REQUIRE(m_subject.directory("visible", ec) == m_photos / "visible");
	REQUIRE(!ec);

	SECTION("cache directory inside the photos root")
	{
		fs::create_directories(m_photos / "cache" / "visible");
		AlbumRepository inside{m_photos, m_photos / "cache"};

		std::vector<AlbumWarning> inside_warnings;
		auto inside_albums = inside.list_albums(inside_warnings);
		REQUIRE(inside_albums.size() == 1);
		REQUIRE(inside_albums.front().slug == "visible");
		REQUIRE(inside_warnings.size() == 1);

		std::error_code ec;
		inside.get_album("cache", ec);
		REQUIRE(ec == Error::album_not_found);
	}
}

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "get_album errors", "[error]")
{
	album("broken", "title = ");

	std::error_code ec;
	m_subject.get_album("no-such-album", ec);
	REQUIRE(ec == Error::album_not_found);

	for (auto slug : {"", ".", "..", "../photos", ".hidden"})
	{
		m_subject.get_album(slug, ec);
		REQUIRE(ec == Error::album_not_found);
	}

	m_subject.get_album("broken", ec);
	REQUIRE(ec == Error::album_metadata_invalid);
	m_subject.directory("broken", ec);
	REQUIRE(ec == Error::album_metadata_invalid);

	fs::create_directories(m_photos / "no-toml");
	m_subject.get_album("no-toml", ec);
	REQUIRE(ec == Error::album_metadata_invalid);
}

TEST_CASE_METHOD(AlbumRepositoryUTFixture, "missing photos root gives no album", "[error]")
{
	AlbumRepository subject{m_root / "nowhere", m_cache};

	std::vector<AlbumWarning> warnings;
	REQUIRE(subject.list_albums(warnings).empty());
	REQUIRE(warnings.empty());
}
