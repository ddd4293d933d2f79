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

namespace kuva {

template <typename T>
class BasicSize
{
public:
	BasicSize() = default;
	BasicSize(T width, T height) : m_width{width}, m_height{height} {}

	T width() const {return m_width;}
	T height() const {return m_height;}

	bool operator==(const BasicSize& other) const {return m_width == other.m_width && m_height == other.m_height;}

private:
	T m_width{};
	T m_height{};
};

using Size2D = BasicSize<int>;

} // end of namespace kuva
