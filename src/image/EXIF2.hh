/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created by nestal on 3/11/26.
//

#pragma once

#include "common/BufferView.hh"

// libexif to read EXIF2 tags
#include <libexif/exif-data.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace kuva {

/// Camera settings of a photo, formatted for display.
struct ExifSummary
{
	std::optional<std::string> camera;
	std::optional<std::string> lens;
	std::optional<std::string> focal_length;    //!< e.g. "18 mm"
	std::optional<std::string> aperture;        //!< f-number without the "ƒ/", e.g. "5.6"
	std::optional<std::string> exposure;        //!< e.g. "1/280"
	std::optional<std::string> iso;

	/// One line such as "FUJIFILM X-T5 · XF18mm · 18 mm  ƒ/5.6  1/280s  ISO 125".
	[[nodiscard]] std::string str() const;
};

/// Read-only access to the EXIF2 tags of an image.
/// Images without EXIF (PNG, most WebP, stripped JPEG) and corrupted EXIF blocks
/// both result in an empty object. Corruption is logged but is never an error.
class EXIF2
{
public:
	explicit EXIF2(BufferView image);
	EXIF2(EXIF2&&) = default;
	EXIF2(const EXIF2&) = delete;
	~EXIF2();

	EXIF2& operator=(EXIF2&&) = default;
	EXIF2& operator=(const EXIF2&) = delete;

	[[nodiscard]] explicit operator bool() const noexcept;

	[[nodiscard]] std::optional<std::chrono::system_clock::time_point> date_time() const;
	[[nodiscard]] ExifSummary summary() const;

private:
	[[nodiscard]] ::ExifEntry* entry(::ExifIfd ifd, ::ExifTag tag) const;
	[[nodiscard]] std::optional<std::string> ascii(::ExifIfd ifd, ::ExifTag tag) const;
	[[nodiscard]] std::optional<::ExifRational> rational(::ExifIfd ifd, ::ExifTag tag) const;

private:
	// Use unique_ptr to ensure the ExifData will be freed.
	struct Unref
	{
		void operator()(::ExifData*) const;
	};
	std::unique_ptr<::ExifData, Unref>  m_data;
};

std::optional<std::chrono::system_clock::time_point> parse_exif_date_time(std::string_view str);
std::optional<std::string> camera_name(std::optional<std::string> make, std::optional<std::string> model);

} // end of namespace
