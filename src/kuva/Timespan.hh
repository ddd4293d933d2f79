/*
	Copyright © 2026 The kuvasivu developers
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created on 3/13/26.
//

#pragma once

#include "PhotoList.hh"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace kuva {

using TimePoint = std::chrono::system_clock::time_point;

/// EXIF capture time of an image file. Files without a readable date are not errors.
std::optional<TimePoint> capture_date(const fs::path& image);

/// "March 2024"
std::string format_year_month(TimePoint tp);

/// "March 2024" if both fall in the same month, otherwise "March 2024 – May 2024".
std::string format_timespan(TimePoint first, TimePoint last);

/// Returns an empty string if none of the photos has a capture date.
std::string derive_timespan(const fs::path& album_dir, const std::vector<Photo>& photos);

} // end of namespace kuva
