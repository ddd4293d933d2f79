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

#include <string_view>

namespace kuva {

using BufferView = std::basic_string_view<unsigned char>;

} // end of namespace
