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

#include <boost/filesystem.hpp>
#include <system_error>

// wrappers for std::error_code -> boost::error_code
// injected to boost::filesystem to make namespace-dependent lookup works
namespace boost::filesystem {

void rename(const path& src, const path& dest, std::error_code& ec);
void create_directories(const path& dir, std::error_code& ec);
void remove(const path& file, std::error_code& ec);

}

namespace kuva {
namespace fs = boost::filesystem;
}
