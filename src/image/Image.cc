/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the kuvasivu
	distribution for more details.
*/

//
// Created by nestal on 3/11/26.
//

#include "Image.hh"

#include "util/Log.hh"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <limits>

namespace kuva {

cv::Mat load_image(BufferView raw)
{
	if (raw.empty() || raw.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
		return {};

	try
	{
		// IMREAD_COLOR also applies the EXIF orientation
		return cv::imdecode(
			cv::Mat{1, static_cast<int>(raw.size()), CV_8U, const_cast<unsigned char*>(raw.data())},
			cv::IMREAD_COLOR
		);
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cannot decode image: %1%", e.what());
		return {};
	}
}

cv::Mat resize_to_fit(const cv::Mat& image, Size2D max)
{
	auto xratio = max.width()  / static_cast<double>(image.cols);
	auto yratio = max.height() / static_cast<double>(image.rows);
	auto ratio  = std::min(xratio, yratio);
	if (ratio >= 1.0)
		return image;

	cv::Size dim{
		std::max(1, static_cast<int>(image.cols * ratio + 0.5)),
		std::max(1, static_cast<int>(image.rows * ratio + 0.5))
	};

	cv::Mat out;
	cv::resize(image, out, dim, 0, 0, cv::INTER_AREA);
	return out;
}

std::vector<unsigned char> encode_jpeg(const cv::Mat& image, int quality)
{
	std::vector<unsigned char> out_buf;
	try
	{
		if (!cv::imencode(".jpg", image, out_buf, {cv::IMWRITE_JPEG_QUALITY, quality}))
			out_buf.clear();
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cannot encode JPEG: %1%", e.what());
		out_buf.clear();
	}
	return out_buf;
}

} // end of namespace kuva
