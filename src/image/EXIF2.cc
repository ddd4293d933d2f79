/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created by nestal on 3/11/26.
//

#include "EXIF2.hh"

#include "util/Log.hh"

#include <libexif/exif-log.h>
#include <libexif/exif-utils.h>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace kuva {

namespace {

const unsigned char exif_header[] = {'E', 'x', 'i', 'f', 0, 0};

void forward_exif_log(::ExifLog*, ::ExifLogCode code, const char *domain, const char *format, va_list args, void*)
{
	// libexif is very chatty at debug level
	if (code == EXIF_LOG_CODE_DEBUG || code == EXIF_LOG_CODE_NONE)
		return;

	char msg[512];
	std::vsnprintf(msg, sizeof(msg), format, args);
	Log(code == EXIF_LOG_CODE_CORRUPT_DATA ? LOG_DEBUG : LOG_WARNING, "libexif (%1%): %2%", domain ? domain : "", msg);
}

bool is_jpeg(BufferView image)
{
	return image.size() > 2 && image[0] == 0xFF && image[1] == 0xD8;
}

/// WebP keeps its EXIF block in a RIFF chunk named "EXIF". libexif only knows how
/// to look for it in JPEG, so we dig it out and give libexif the raw TIFF structure
/// with an EXIF header in front.
std::vector<unsigned char> webp_exif(BufferView image)
{
	auto fourcc = [&image](std::size_t pos, const char *code)
	{
		return pos + 4 <= image.size() && std::memcmp(image.data() + pos, code, 4) == 0;
	};
	if (!fourcc(0, "RIFF") || !fourcc(8, "WEBP"))
		return {};

	for (std::size_t pos = 12 ; pos + 8 <= image.size() ; )
	{
		auto length  = boost::endian::load_little_u32(image.data() + pos + 4);
		auto payload = pos + 8;
		if (length > image.size() - payload)
			break;

		if (fourcc(pos, "EXIF"))
		{
			auto chunk = image.substr(payload, length);
			std::vector<unsigned char> result;
			if (chunk.substr(0, sizeof(exif_header)) != BufferView{exif_header, sizeof(exif_header)})
				result.assign(std::begin(exif_header), std::end(exif_header));
			result.insert(result.end(), chunk.begin(), chunk.end());
			return result;
		}

		// chunks are padded to even size
		pos = payload + length + (length & 1U);
	}
	return {};
}

std::string clean_exif_value(std::string_view raw)
{
	auto is_blank = [](char c){return c == '"' || c == '\0' || std::isspace(static_cast<unsigned char>(c));};
	while (!raw.empty() && is_blank(raw.front()))
		raw.remove_prefix(1);
	while (!raw.empty() && is_blank(raw.back()))
		raw.remove_suffix(1);
	return std::string{raw};
}

std::string format_decimal(double value)
{
	std::ostringstream ss;
	ss << std::fixed << std::setprecision(1) << value;

	auto str = ss.str();
	if (str.size() > 2 && str.compare(str.size()-2, 2, ".0") == 0)
		str.resize(str.size()-2);
	return str;
}

std::string format_exposure(::ExifRational exposure)
{
	auto value = static_cast<double>(exposure.numerator) / exposure.denominator;
	if (exposure.numerator >= exposure.denominator)
		return format_decimal(value);

	return "1/" + std::to_string(std::lround(1.0 / value));
}

} // end of anonymous namespace

EXIF2::EXIF2(BufferView image) : m_data{::exif_data_new()}
{
	if (!m_data)
		return;

	if (auto log = ::exif_log_new(); log)
	{
		::exif_log_set_func(log, &forward_exif_log, nullptr);
		::exif_data_log(m_data.get(), log);
		::exif_log_unref(log);
	}

	auto load = [this](BufferView data)
	{
		auto size = std::min<std::size_t>(data.size(), std::numeric_limits<unsigned int>::max());
		::exif_data_load_data(m_data.get(), data.data(), static_cast<unsigned int>(size));
	};

	if (is_jpeg(image))
		load(image);
	else if (auto exif = webp_exif(image); !exif.empty())
		load({exif.data(), exif.size()});
}

EXIF2::~EXIF2() = default;

EXIF2::operator bool() const noexcept
{
	if (!m_data)
		return false;

	return std::any_of(std::begin(m_data->ifd), std::end(m_data->ifd), [](::ExifContent *content)
	{
		return content && content->count > 0;
	});
}

::ExifEntry* EXIF2::entry(::ExifIfd ifd, ::ExifTag tag) const
{
	if (!m_data)
		return nullptr;

	// some cameras put the tags in the wrong IFD
	if (auto result = ::exif_content_get_entry(m_data->ifd[ifd], tag); result)
		return result;
	return exif_data_get_entry(m_data.get(), tag);
}

std::optional<std::string> EXIF2::ascii(::ExifIfd ifd, ::ExifTag tag) const
{
	if (auto e = entry(ifd, tag); e && e->format == EXIF_FORMAT_ASCII)
	{
		char buf[1024] = {};
		::exif_entry_get_value(e, buf, sizeof(buf));

		if (auto value = clean_exif_value(buf); !value.empty())
			return value;
	}
	return std::nullopt;
}

std::optional<::ExifRational> EXIF2::rational(::ExifIfd ifd, ::ExifTag tag) const
{
	if (auto e = entry(ifd, tag); e && e->format == EXIF_FORMAT_RATIONAL && e->components > 0 && e->size >= 8)
	{
		auto value = ::exif_get_rational(e->data, ::exif_data_get_byte_order(m_data.get()));
		if (value.denominator != 0)
			return value;
	}
	return std::nullopt;
}

std::optional<std::chrono::system_clock::time_point> EXIF2::date_time() const
{
	if (auto original = ascii(EXIF_IFD_EXIF, EXIF_TAG_DATE_TIME_ORIGINAL); original)
		if (auto tp = parse_exif_date_time(*original); tp)
			return tp;

	if (auto modified = ascii(EXIF_IFD_0, EXIF_TAG_DATE_TIME); modified)
		return parse_exif_date_time(*modified);

	return std::nullopt;
}

ExifSummary EXIF2::summary() const
{
	ExifSummary result;
	result.camera = camera_name(ascii(EXIF_IFD_0, EXIF_TAG_MAKE), ascii(EXIF_IFD_0, EXIF_TAG_MODEL));
	result.lens   = ascii(EXIF_IFD_EXIF, EXIF_TAG_LENS_MODEL);

	if (auto focal = rational(EXIF_IFD_EXIF, EXIF_TAG_FOCAL_LENGTH); focal)
		result.focal_length = format_decimal(static_cast<double>(focal->numerator) / focal->denominator) + " mm";
	if (auto fnumber = rational(EXIF_IFD_EXIF, EXIF_TAG_FNUMBER); fnumber)
		result.aperture = format_decimal(static_cast<double>(fnumber->numerator) / fnumber->denominator);
	if (auto exposure = rational(EXIF_IFD_EXIF, EXIF_TAG_EXPOSURE_TIME); exposure && exposure->numerator > 0)
		result.exposure = format_exposure(*exposure);

	if (auto e = entry(EXIF_IFD_EXIF, EXIF_TAG_ISO_SPEED_RATINGS); e && e->components > 0)
	{
		auto order = ::exif_data_get_byte_order(m_data.get());
		if (e->format == EXIF_FORMAT_SHORT && e->size >= 2)
			result.iso = std::to_string(::exif_get_short(e->data, order));
		else if (e->format == EXIF_FORMAT_LONG && e->size >= 4)
			result.iso = std::to_string(::exif_get_long(e->data, order));
	}
	return result;
}

void EXIF2::Unref::operator()(::ExifData *data) const
{
	if (data)
		::exif_data_unref(data);
}

std::optional<std::chrono::system_clock::time_point> parse_exif_date_time(std::string_view str)
{
	std::string copy{str};
	for (auto format : {"%Y:%m:%d %H:%M:%S", "%Y-%m-%d %H:%M:%S"})
	{
		struct std::tm result{};
		if (::strptime(copy.c_str(), format, &result))
			return std::chrono::system_clock::from_time_t(::timegm(&result));
	}
	return std::nullopt;
}

std::optional<std::string> camera_name(std::optional<std::string> make, std::optional<std::string> model)
{
	if (make && model)
		return model->compare(0, make->size(), *make) == 0 ? std::move(model) : *make + " " + *model;
	else
		return make ? std::move(make) : std::move(model);
}

std::string ExifSummary::str() const
{
	std::vector<std::string> settings;
	if (focal_length)
		settings.push_back(*focal_length);
	if (aperture)
		settings.push_back("ƒ/" + *aperture);
	if (exposure)
		settings.push_back(*exposure + "s");
	if (iso)
		settings.push_back("ISO " + *iso);

	auto join = [](const std::vector<std::string>& parts, std::string_view sep)
	{
		std::string result;
		for (auto&& part : parts)
		{
			if (!result.empty())
				result.append(sep);
			result.append(part);
		}
		return result;
	};

	std::vector<std::string> parts;
	if (camera)
		parts.push_back(*camera);
	if (lens)
		parts.push_back(*lens);
	if (!settings.empty())
		parts.push_back(join(settings, "  "));

	return join(parts, " · ");
}

} // end of namespace
