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

#include "image/EXIF2.hh"
#include "TestImages.hh"

#include <algorithm>
#include <ctime>

using namespace kuva;

namespace {

std::tm utc(std::chrono::system_clock::time_point tp)
{
	auto time = std::chrono::system_clock::to_time_t(tp);
	std::tm result{};
	::gmtime_r(&time, &result);
	return result;
}

}

TEST_CASE("read date time from DateTimeOriginal", "[normal]")
{
	test::ExifFields fields;
	fields.date_time_original = "2024:03:15 10:20:30";
	fields.date_time          = "2025:01:01 00:00:00";
	auto jpeg = test::jpeg_image(64, 48, 0, fields);

	EXIF2 subject{{jpeg.data(), jpeg.size()}};
	REQUIRE(subject);

	auto dt = subject.date_time();
	REQUIRE(dt.has_value());

	auto tm = utc(*dt);
	REQUIRE(tm.tm_year + 1900 == 2024);
	REQUIRE(tm.tm_mon == 2);
	REQUIRE(tm.tm_mday == 15);
	REQUIRE(tm.tm_hour == 10);
	REQUIRE(tm.tm_min == 20);
	REQUIRE(tm.tm_sec == 30);
}

TEST_CASE("fall back to DateTime if there is no DateTimeOriginal", "[normal]")
{
	test::ExifFields fields;
	fields.date_time = "2023-12-24 18:00:00";
	auto jpeg = test::jpeg_image(64, 48, 0, fields);

	auto dt = EXIF2{{jpeg.data(), jpeg.size()}}.date_time();
	REQUIRE(dt.has_value());
	REQUIRE(utc(*dt).tm_year + 1900 == 2023);
	REQUIRE(utc(*dt).tm_mon == 11);
}

TEST_CASE("images without EXIF have no date", "[normal]")
{
	auto jpeg = test::jpeg_image(64, 48);
	EXIF2 jpeg_exif{{jpeg.data(), jpeg.size()}};
	REQUIRE_FALSE(jpeg_exif);
	REQUIRE_FALSE(jpeg_exif.date_time().has_value());

	auto png = test::encode(test::pattern_image(64, 48), ".png");
	REQUIRE_FALSE(EXIF2{{png.data(), png.size()}}.date_time().has_value());

	SECTION("not an image at all")
	{
		std::string_view text{"hello, world!"};
		EXIF2 subject{{reinterpret_cast<const unsigned char*>(text.data()), text.size()}};
		REQUIRE_FALSE(subject);
		REQUIRE_FALSE(subject.date_time().has_value());
	}
}

TEST_CASE("corrupted EXIF is treated as absent", "[error]")
{
	test::ExifFields fields;
	fields.date_time_original = "2024:03:15 10:20:30";
	auto jpeg = test::jpeg_image(64, 48, 0, fields);

	// overwrite the TIFF header after "Exif\0\0"
	REQUIRE(jpeg.size() > 20);
	for (std::size_t i = 12; i < 20; ++i)
		jpeg[i] = 0xAA;

	REQUIRE_FALSE(EXIF2{{jpeg.data(), jpeg.size()}}.date_time().has_value());
}

TEST_CASE("unparsable dates are absent", "[error]")
{
	test::ExifFields fields;
	fields.date_time_original = "sometime last spring";
	auto jpeg = test::jpeg_image(64, 48, 0, fields);

	REQUIRE_FALSE(EXIF2{{jpeg.data(), jpeg.size()}}.date_time().has_value());
}

TEST_CASE("camera settings summary", "[normal]")
{
	test::ExifFields fields;
	fields.make          = "FUJIFILM";
	fields.model         = "X-T5";
	fields.lens          = "XF18mmF2 R";
	fields.focal_length  = ExifRational{18, 1};
	fields.fnumber       = ExifRational{56, 10};
	fields.exposure_time = ExifRational{1, 280};
	fields.iso           = 125;
	auto jpeg = test::jpeg_image(64, 48, 0, fields);

	auto summary = EXIF2{{jpeg.data(), jpeg.size()}}.summary();
	REQUIRE(summary.camera == "FUJIFILM X-T5");
	REQUIRE(summary.lens == "XF18mmF2 R");
	REQUIRE(summary.focal_length == "18 mm");
	REQUIRE(summary.aperture == "5.6");
	REQUIRE(summary.exposure == "1/280");
	REQUIRE(summary.iso == "125");
	REQUIRE(summary.str() == "FUJIFILM X-T5 · XF18mmF2 R · 18 mm  ƒ/5.6  1/280s  ISO 125");

	SECTION("missing parts are skipped")
	{
		summary.lens.reset();
		summary.iso.reset();
		REQUIRE(summary.str() == "FUJIFILM X-T5 · 18 mm  ƒ/5.6  1/280s");
	}
	SECTION("nothing at all")
	{
		REQUIRE(ExifSummary{}.str().empty());
	}
}

TEST_CASE("camera name does not repeat the maker", "[normal]")
{
	REQUIRE(camera_name("Canon", "Canon EOS R6") == "Canon EOS R6");
	REQUIRE(camera_name("SONY", "ILCE-7M3") == "SONY ILCE-7M3");
	REQUIRE(camera_name(std::nullopt, "ILCE-7M3") == "ILCE-7M3");
	REQUIRE(camera_name("SONY", std::nullopt) == "SONY");
	REQUIRE_FALSE(camera_name(std::nullopt, std::nullopt).has_value());
}

TEST_CASE("EXIF date formats", "[normal]")
{
	REQUIRE(parse_exif_date_time("2024:05:01 00:00:00").has_value());
	REQUIRE(parse_exif_date_time("2024-05-01 00:00:00").has_value());
	REQUIRE(parse_exif_date_time("2024:05:01 00:00:00") == parse_exif_date_time("2024-05-01 00:00:00"));
	REQUIRE_FALSE(parse_exif_date_time("").has_value());
	REQUIRE_FALSE(parse_exif_date_time("    :  :     :  :  ").has_value());
}

TEST_CASE("read date time from WebP", "[normal]")
{
	test::ExifFields fields;
	fields.date_time_original = "2022:08:09 07:06:05";
	fields.make               = "SONY";
	fields.model              = "ILCE-7M3";

	auto check = [](const std::vector<unsigned char>& webp)
	{
		EXIF2 subject{{webp.data(), webp.size()}};
		REQUIRE(subject);

		auto dt = subject.date_time();
		REQUIRE(dt.has_value());
		REQUIRE(utc(*dt).tm_year + 1900 == 2022);
		REQUIRE(utc(*dt).tm_mon == 7);
		REQUIRE(utc(*dt).tm_mday == 9);
		REQUIRE(subject.summary().camera == "SONY ILCE-7M3");
	};

	SECTION("raw TIFF in the EXIF chunk")
	{
		check(test::webp_image(64, 48, 0, fields));
	}
	SECTION("EXIF chunk with the Exif header")
	{
		check(test::webp_image(64, 48, 0, fields, true));
	}
	SECTION("odd-size chunk before the EXIF chunk")
	{
		auto webp = test::append_chunk(test::webp_image(64, 48), "XTRA", {1, 2, 3});
		check(test::append_chunk(std::move(webp), "EXIF", test::exif_block(fields)));
	}
}

TEST_CASE("WebP without usable EXIF", "[error]")
{
	SECTION("no EXIF chunk")
	{
		auto webp = test::webp_image(64, 48);
		EXIF2 subject{{webp.data(), webp.size()}};
		REQUIRE_FALSE(subject);
		REQUIRE_FALSE(subject.date_time().has_value());
	}
	SECTION("EXIF chunk longer than the file")
	{
		test::ExifFields fields;
		fields.date_time_original = "2022:08:09 07:06:05";
		auto block = test::exif_block(fields);

		auto webp = test::append_chunk(test::webp_image(64, 48), "EXIF", block, static_cast<std::uint32_t>(block.size() + 100));
		EXIF2 subject{{webp.data(), webp.size()}};
		REQUIRE_FALSE(subject);
		REQUIRE_FALSE(subject.date_time().has_value());
	}
	SECTION("RIFF but not WebP")
	{
		test::ExifFields fields;
		fields.date_time_original = "2022:08:09 07:06:05";
		auto webp = test::webp_image(64, 48, 0, fields);
		std::copy_n("WAVE", 4, webp.begin() + 8);

		REQUIRE_FALSE(EXIF2{{webp.data(), webp.size()}}.date_time().has_value());
	}
}
