/*
	Copyright © 2026 The kuvasivu developers
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created on 3/16/26.
//

#include <catch2/catch.hpp>

#include "kuva/AlbumMeta.hh"
#include "TestImages.hh"

#include <boost/exception/get_error_info.hpp>

using namespace kuva;

TEST_CASE("parse album.toml", "[normal]")
{
	auto meta = AlbumMeta::parse(R"(
title = "Lapland"
description = "Northern lights and reindeer"
timespan = "Winter 2023"
)", "album.toml");

	REQUIRE(meta.title == "Lapland");
	REQUIRE(meta.description == "Northern lights and reindeer");
	REQUIRE(meta.timespan == "Winter 2023");

	SECTION("optional fields")
	{
		auto title_only = AlbumMeta::parse("title = 'Helsinki'", "album.toml");
		REQUIRE(title_only.title == "Helsinki");
		REQUIRE_FALSE(title_only.description.has_value());
		REQUIRE_FALSE(title_only.timespan.has_value());
	}
	SECTION("unknown keys are allowed")
	{
		REQUIRE(AlbumMeta::parse("title = 'a'\ncover = 'b.jpg'\n", "album.toml").title == "a");
	}
}

TEST_CASE("album.toml without title", "[error]")
{
	REQUIRE_THROWS_AS(AlbumMeta::parse("description = \"no title\"", "album.toml"), AlbumMeta::Error);
	REQUIRE_THROWS_AS(AlbumMeta::parse("title = \"\"", "album.toml"), AlbumMeta::Error);
	REQUIRE_THROWS_AS(AlbumMeta::parse("", "album.toml"), AlbumMeta::Error);
}

TEST_CASE("malformed album.toml", "[error]")
{
	REQUIRE_THROWS_AS(AlbumMeta::parse("title = \"unterminated", "album.toml"), AlbumMeta::Error);
	REQUIRE_THROWS_AS(AlbumMeta::parse("title = 42", "album.toml"), AlbumMeta::Error);
	REQUIRE_THROWS_AS(AlbumMeta::parse("title = 'a'\ntimespan = 2024", "album.toml"), AlbumMeta::Error);

	try
	{
		AlbumMeta::parse("title = ", "/photos/x/album.toml");
		FAIL("no exception thrown");
	}
	catch (AlbumMeta::Error& e)
	{
		REQUIRE(boost::get_error_info<ErrorPath>(e));
		REQUIRE(*boost::get_error_info<ErrorPath>(e) == "/photos/x/album.toml");
		REQUIRE(boost::get_error_info<ErrorMessage>(e));
	}
}

TEST_CASE("missing album.toml", "[error]")
{
	fs::remove_all("/tmp/AlbumMeta-UT");
	fs::create_directories("/tmp/AlbumMeta-UT");

	try
	{
		AlbumMeta::load("/tmp/AlbumMeta-UT/album.toml");
		FAIL("no exception thrown");
	}
	catch (AlbumMeta::Error& e)
	{
		auto code = boost::get_error_info<ErrorCode>(e);
		REQUIRE(code);
		REQUIRE(*code == std::errc::no_such_file_or_directory);
	}

	SECTION("load from file")
	{
		test::write_file("/tmp/AlbumMeta-UT/album.toml", "title = \"From file\"\n");
		REQUIRE(AlbumMeta::load("/tmp/AlbumMeta-UT/album.toml").title == "From file");
	}
}

TEST_CASE("parse site.toml", "[normal]")
{
	auto site = SiteMeta::parse("title = \"My Portfolio\"\nfooter_snippet = \"<p>hi</p>\"", "site.toml");
	REQUIRE(site.title == "My Portfolio");
	REQUIRE(site.footer_snippet == "<p>hi</p>");

	SECTION("default title")
	{
		auto untitled = SiteMeta::parse("", "site.toml");
		REQUIRE(untitled.title == "Kuvasivu");
		REQUIRE_FALSE(untitled.footer_snippet.has_value());
	}
	SECTION("malformed")
	{
		REQUIRE_THROWS_AS(SiteMeta::parse("title = [", "site.toml"), SiteMeta::Error);
		REQUIRE_THROWS_AS(SiteMeta::load("/tmp/no/such/site.toml"), SiteMeta::Error);
	}
}
