/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/13/26.
//

#include "Timespan.hh"

#include "common/Error.hh"
#include "common/MMap.hh"
#include "image/EXIF2.hh"
#include "util/Log.hh"

#include <array>
#include <ctime>

namespace kuva {
namespace {

const std::array<const char*, 12> month_names{
	"January", "February", "March", "April", "May", "June",
	"July", "August", "September", "October", "November", "December"
};

std::tm to_tm(TimePoint tp)
{
	auto time = std::chrono::system_clock::to_time_t(tp);
	std::tm result{};
	::gmtime_r(&time, &result);
	return result;
}

} // end of local namespace

std::optional<TimePoint> capture_date(const fs::path& image)
{
	std::error_code ec;
	auto mmap = MMap::open(image, ec);
	if (ec)
	{
		Log(LOG_WARNING, "%1%: %2% (%3%)", image, std::error_code{Error::exif_read_failure}.message(), ec.message());
		return std::nullopt;
	}

	return EXIF2{mmap.buffer()}.date_time();
}

std::string format_year_month(TimePoint tp)
{
	auto tm = to_tm(tp);
	return std::string{month_names.at(static_cast<std::size_t>(tm.tm_mon))} + " " + std::to_string(tm.tm_year + 1900);
}

std::string format_timespan(TimePoint first, TimePoint last)
{
	auto begin = format_year_month(first);
	auto end   = format_year_month(last);
	return begin == end ? begin : begin + " – " + end;
}

std::string derive_timespan(const fs::path& album_dir, const std::vector<Photo>& photos)
{
	std::optional<TimePoint> first, last;
	for (auto&& photo : photos)
	{
		if (auto date = capture_date(album_dir / photo.filename); date)
		{
			if (!first || *date < *first)
				first = date;
			if (!last || *date > *last)
				last = date;
		}
	}
	return first && last ? format_timespan(*first, *last) : std::string{};
}

} // end of namespace kuva
