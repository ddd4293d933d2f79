/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created by nestal on 3/9/26.
//

#pragma once

#include <boost/format.hpp>

#include <string>
#include <utility>

#include <syslog.h>

namespace kuva {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

template <typename... Args>
void Log(int priority, const std::string& fmt, Args&&... args)
{
	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
