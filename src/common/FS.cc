/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created by nestal on 3/9/26.
//

#include "FS.hh"

namespace boost::filesystem {

void rename(const path& src, const path& dest, std::error_code& ec)
{
	boost::system::error_code bec;
	rename(src, dest, bec);
	if (bec)
		ec.assign(bec.value(), std::generic_category());
	else
		ec.clear();
}

void create_directories(const path& dir, std::error_code& ec)
{
	boost::system::error_code bec;
	create_directories(dir, bec);
	if (bec)
		ec.assign(bec.value(), std::generic_category());
	else
		ec.clear();
}

void remove(const path& file, std::error_code& ec)
{
	boost::system::error_code bec;
	remove(file, bec);
	if (bec)
		ec.assign(bec.value(), std::generic_category());
	else
		ec.clear();
}

} // end of namespace
