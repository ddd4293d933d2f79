/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the kuvasivu
    distribution for more details.
*/

//
// Created by nestal on 3/9/26.
//

#include "Error.hh"

#include <string>

namespace kuva {

const std::error_category& kuva_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "kuva"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::album_not_found: return "album not found";
				case Error::photo_not_found: return "photo not found";
				case Error::album_metadata_invalid: return "album metadata missing or invalid";
				case Error::invalid_album_name: return "album directory name is not URL-safe";
				case Error::image_decode_failure: return "cannot decode image";
				case Error::image_encode_failure: return "cannot encode image";
				case Error::cache_write_failure: return "cannot write to cache";
				case Error::exif_read_failure: return "cannot read EXIF data";
				case Error::invalid_size_class: return "invalid size class";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), kuva_error_category());
}

} // end of namespace
