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

#include <system_error>

namespace kuva {

enum class Error
{
	ok,
	album_not_found,
	photo_not_found,
	album_metadata_invalid,
	invalid_album_name,
	image_decode_failure,
	image_encode_failure,
	cache_write_failure,
	exif_read_failure,
	invalid_size_class,

	unknown_error
};

const std::error_category& kuva_error_category();
std::error_code make_error_code(Error err);

} // end of namespace kuva

namespace std
{
	template <> struct is_error_code_enum<kuva::Error> : true_type {};
}
