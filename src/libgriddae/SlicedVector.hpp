// =============================================================================
//  GridDAE
//  
//  Copyright © 2023-present: The GridDAE Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file 
 * Defines a SlicedVector which replaces vectors of vectors
 */

#ifndef LIBGRIDDAE_SLICEDVECTOR_HPP_
#define LIBGRIDDAE_SLICEDVECTOR_HPP_

#include "common/CompilerSpecific.hpp"
#include <vector>

namespace griddae
{

namespace util
{

/**
 * @brief An append-only vector of slices stored in one contiguous array
 * @details The start index of each slice is kept in a separate index vector, slice @c i
 *          occupies the range <tt>[_index[i], _index[i+1])</tt> of the value array.
 * @tparam T Type of the saved data
 */
template <typename T>
class SlicedVector
{
public:
	typedef typename std::vector<T>::size_type size_type;

	SlicedVector() : _index(1, 0) { }
	~SlicedVector() GRIDDAE_NOEXCEPT { }

	SlicedVector(const SlicedVector<T>& cpy) = default;
	SlicedVector(SlicedVector<T>&& cpy) GRIDDAE_NOEXCEPT = default;

	inline SlicedVector<T>& operator=(const SlicedVector<T>& cpy) = default;
	inline SlicedVector<T>& operator=(SlicedVector<T>&& cpy) = default;

	inline bool empty() const { return _index.size() == 1; }

	inline void clear()
	{
		_index.resize(1);
		_values.clear();
	}

	/**
	 * @brief Appends an empty slice
	 */
	inline void pushBackSlice()
	{
		_index.push_back(_index.back());
	}

	/**
	 * @brief Appends a given slice 
	 * @param [in] slice Slice to append
	 */
	inline void pushBackSlice(const std::vector<T>& slice)
	{
		_index.push_back(_index.back() + slice.size());
		_values.insert(_values.end(), slice.begin(), slice.end());
	}

	/**
	 * @brief Appends an element to the last slice
	 * @param [in] value Element to append
	 */
	inline void pushBackInLastSlice(const T& value)
	{
		griddae_assert(!empty());
		++_index.back();
		_values.push_back(value);
	}

	inline bool operator==(const SlicedVector& rhs) const
	{
		return (_index == rhs._index) && (_values == rhs._values);
	}

	/**
	 * @brief Number of slices
	 */
	inline size_type slices() const GRIDDAE_NOEXCEPT { return _index.size() - 1; }

	/**
	 * @brief Total number of stored elements in all slices
	 */
	inline size_type size() const GRIDDAE_NOEXCEPT { return _values.size(); }

	inline size_type sliceSize(size_type idxSlice) const
	{
		griddae_assert(idxSlice < slices());
		return _index[idxSlice + 1] - _index[idxSlice];
	}

	inline T* operator[](size_type idxSlice)
	{
		griddae_assert(idxSlice < slices());
		return _values.data() + _index[idxSlice];
	}

	inline T const* operator[](size_type idxSlice) const
	{
		griddae_assert(idxSlice < slices());
		return _values.data() + _index[idxSlice];
	}

	inline T& operator()(size_type idxSlice, size_type idxElem)
	{
		griddae_assert(idxElem < sliceSize(idxSlice));
		return _values[_index[idxSlice] + idxElem];
	}

	inline const T& operator()(size_type idxSlice, size_type idxElem) const
	{
		griddae_assert(idxElem < sliceSize(idxSlice));
		return _values[_index[idxSlice] + idxElem];
	}

	inline T const* begin(size_type idxSlice) const { return _values.data() + _index[idxSlice]; }
	inline T const* end(size_type idxSlice) const { return _values.data() + _index[idxSlice + 1]; }

	inline T const* data() const GRIDDAE_NOEXCEPT { return _values.data(); }

protected:
	std::vector<T> _values; //!< Linearized values of all slices
	std::vector<size_type> _index; //!< Start index of each slice, last element is the total size
};

} // namespace util

} // namespace griddae

#endif  // LIBGRIDDAE_SLICEDVECTOR_HPP_
