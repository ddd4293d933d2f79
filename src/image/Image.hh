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
#include "util/Size2D.hh"

#include <opencv2/core.hpp>

#include <vector>

namespace kuva {

/// Decode JPEG, PNG or WebP into a 3-channel BGR image. Returns an empty cv::Mat if
/// the data cannot be decoded.
cv::Mat load_image(BufferView raw);

/// Scale down to fit inside \a max, keeping the aspect ratio. Smaller images are
/// returned as is.
cv::Mat resize_to_fit(const cv::Mat& image, Size2D max);

/// Returns an empty vector if encoding failed.
std::vector<unsigned char> encode_jpeg(const cv::Mat& image, int quality);

} // end of namespace kuva
